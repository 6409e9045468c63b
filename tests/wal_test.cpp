#include "persistence/log_entry.hpp"
#include "persistence/wal.hpp"

#include <csignal>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <sys/resource.h>

#include <gtest/gtest.h>

namespace walkv::persistence {

namespace {

// Lowers the soft file-size limit while in scope. SIGXFSZ is ignored so a
// write past the limit fails with EFBIG instead of killing the process.
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        ::getrlimit(RLIMIT_FSIZE, &saved_);
        previous_ = std::signal(SIGXFSZ, SIG_IGN);
        rlimit lowered = saved_;
        lowered.rlim_cur = bytes;
        applied_ = ::setrlimit(RLIMIT_FSIZE, &lowered) == 0;
    }

    ~FileSizeLimit() {
        ::setrlimit(RLIMIT_FSIZE, &saved_);
        std::signal(SIGXFSZ, previous_);
    }

    FileSizeLimit(const FileSizeLimit&) = delete;
    FileSizeLimit& operator=(const FileSizeLimit&) = delete;

    bool applied() const { return applied_; }

private:
    rlimit saved_{};
    void (*previous_)(int) = SIG_DFL;
    bool applied_ = false;
};

} // namespace

// ── Fixture ──────────────────────────────────────────────────────────────────

class WALTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("walkv_wal_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        wal_dir_ = test_dir_ / "wal";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    WalOptions options(uint64_t segment_size = kDefaultSegmentSize) const {
        return WalOptions{wal_dir_, segment_size, {}};
    }

    WalOptions zlib_options(int level = kDefaultCompressionLevel) const {
        return WalOptions{wal_dir_, kDefaultSegmentSize, {Compression::Zlib, level}};
    }

    static uint64_t append_ok(WAL& wal, const LogEntry& entry) {
        uint64_t seq = 0;
        auto ec = wal.append(entry, seq);
        EXPECT_FALSE(ec) << ec.message();
        return seq;
    }

    std::vector<Segment> segments(const WAL& wal) const {
        std::vector<Segment> out;
        auto ec = wal.list_segments(out);
        EXPECT_FALSE(ec) << ec.message();
        return out;
    }

    static std::vector<uint8_t> read_bytes(const std::filesystem::path& p) {
        std::ifstream in(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    static void write_bytes(const std::filesystem::path& p, const std::vector<uint8_t>& b) {
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(b.data()),
                  static_cast<std::streamsize>(b.size()));
    }

    static void append_bytes(const std::filesystem::path& p, const std::string& s) {
        std::ofstream out(p, std::ios::binary | std::ios::app);
        out.write(s.data(), static_cast<std::streamsize>(s.size()));
    }

    std::filesystem::path test_dir_;
    std::filesystem::path wal_dir_;
};

// ── Open / Close ─────────────────────────────────────────────────────────────

TEST_F(WALTest, OpenCreatesDirectoryAndFirstSegment) {
    WAL wal(options());
    auto ec = wal.open();
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(wal.is_open());
    EXPECT_EQ(wal.next_sequence(), 1u);
    EXPECT_EQ(wal.current_segment_size(), kSegmentHeaderSize);

    auto segs = segments(wal);
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].first_sequence, 1u);
    EXPECT_EQ(segs[0].path.filename().string(), "segment-00000000000000000001.log");

    auto bytes = read_bytes(segs[0].path);
    ASSERT_EQ(bytes.size(), kSegmentHeaderSize);
    EXPECT_EQ(std::memcmp(bytes.data(), kSegmentMagic, kSegmentMagicSize), 0);
}

TEST_F(WALTest, SegmentFilenameIsZeroPadded) {
    EXPECT_EQ(WAL::segment_filename(1), "segment-00000000000000000001.log");
    EXPECT_EQ(WAL::segment_filename(12345), "segment-00000000000000012345.log");
}

TEST_F(WALTest, OpenIsIdempotentAndCloseTwiceIsSafe) {
    WAL wal(options());
    ASSERT_FALSE(wal.open());
    ASSERT_FALSE(wal.open());
    wal.close();
    wal.close();
    EXPECT_FALSE(wal.is_open());
}

TEST_F(WALTest, AppendWhenClosedFails) {
    WAL wal(options());
    uint64_t seq = 0;
    EXPECT_EQ(wal.append(LogEntry::put("k", "v"), seq), std::errc::bad_file_descriptor);

    ASSERT_FALSE(wal.open());
    wal.close();
    EXPECT_EQ(wal.append(LogEntry::put("k", "v"), seq), std::errc::bad_file_descriptor);
    EXPECT_EQ(wal.rotate(), std::errc::bad_file_descriptor);
}

TEST_F(WALTest, ReadAllOnMissingDirectoryIsEmpty) {
    WAL wal(options());
    std::vector<LogEntry> entries{LogEntry::put("stale", "x")};
    auto ec = wal.read_all(entries);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(entries.empty());
}

TEST_F(WALTest, OpenRejectsForeignHeader) {
    std::filesystem::create_directories(wal_dir_);
    write_bytes(wal_dir_ / WAL::segment_filename(1),
                {'N', 'O', 'T', 'W', 'A', 'L', 0, 0, 0});

    WAL wal(options());
    EXPECT_TRUE(wal.open());
    EXPECT_FALSE(wal.is_open());
}

TEST_F(WALTest, UnrelatedFilesAreIgnored) {
    std::filesystem::create_directories(wal_dir_);
    append_bytes(wal_dir_ / "notes.txt", "hello");
    append_bytes(wal_dir_ / "segment-abc.log", "junk");

    WAL wal(options());
    ASSERT_FALSE(wal.open());
    EXPECT_EQ(segments(wal).size(), 1u);
}

// ── Append / Read ────────────────────────────────────────────────────────────

TEST_F(WALTest, AppendAssignsConsecutiveSequences) {
    WAL wal(options());
    ASSERT_FALSE(wal.open());

    EXPECT_EQ(append_ok(wal, LogEntry::put("a", "1")), 1u);
    EXPECT_EQ(append_ok(wal, LogEntry::put("b", "2")), 2u);
    EXPECT_EQ(append_ok(wal, LogEntry::del("a")), 3u);
    EXPECT_EQ(wal.next_sequence(), 4u);
}

TEST_F(WALTest, ReadAllReturnsEntriesInOrder) {
    WAL wal(options());
    ASSERT_FALSE(wal.open());
    append_ok(wal, LogEntry::put("a", "1"));
    append_ok(wal, LogEntry::put("b", "two words"));
    append_ok(wal, LogEntry::del("a"));
    append_ok(wal, LogEntry::checkpoint());

    std::vector<LogEntry> entries;
    auto ec = wal.read_all(entries);
    ASSERT_FALSE(ec) << ec.message();
    ASSERT_EQ(entries.size(), 4u);

    EXPECT_EQ(entries[0].operation(), Operation::Put);
    EXPECT_EQ(entries[0].key(), "a");
    EXPECT_EQ(entries[1].value(), "two words");
    EXPECT_EQ(entries[2].operation(), Operation::Delete);
    EXPECT_EQ(entries[3].operation(), Operation::Checkpoint);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].sequence(), i + 1);
    }
}

TEST_F(WALTest, EveryAppendReachesTheFile) {
    WAL wal(options());
    ASSERT_FALSE(wal.open());
    append_ok(wal, LogEntry::put("k", "v"));

    const auto seg = segments(wal).back().path;
    const auto expected = kSegmentHeaderSize +
                          LogEntry::put("k", "v").with_sequence(1).encode().size();
    EXPECT_EQ(std::filesystem::file_size(seg), expected);
    EXPECT_EQ(wal.current_segment_size(), expected);
}

TEST_F(WALTest, SequencesContinueAcrossReopen) {
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        append_ok(wal, LogEntry::put("b", "2"));
    }

    WAL wal(options());
    ASSERT_FALSE(wal.open());
    EXPECT_EQ(wal.next_sequence(), 3u);
    EXPECT_EQ(append_ok(wal, LogEntry::put("c", "3")), 3u);

    std::vector<LogEntry> entries;
    ASSERT_FALSE(wal.read_all(entries));
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[2].key(), "c");
}

// ── Rotation ─────────────────────────────────────────────────────────────────

TEST_F(WALTest, RotateOnEmptySegmentIsNoOp) {
    WAL wal(options());
    ASSERT_FALSE(wal.open());
    ASSERT_FALSE(wal.rotate());
    EXPECT_EQ(segments(wal).size(), 1u);
}

TEST_F(WALTest, RotateStartsSegmentNamedAfterNextSequence) {
    WAL wal(options());
    ASSERT_FALSE(wal.open());
    append_ok(wal, LogEntry::put("a", "1"));
    append_ok(wal, LogEntry::put("b", "2"));
    ASSERT_FALSE(wal.rotate());

    auto segs = segments(wal);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].first_sequence, 1u);
    EXPECT_EQ(segs[1].first_sequence, 3u);
    EXPECT_EQ(wal.current_segment_size(), kSegmentHeaderSize);

    EXPECT_EQ(append_ok(wal, LogEntry::put("c", "3")), 3u);
}

TEST_F(WALTest, SizeThresholdRotatesBeforeAppend) {
    // Every record is larger than the threshold: one entry per segment.
    WAL wal(options(16));
    ASSERT_FALSE(wal.open());
    for (int i = 0; i < 5; ++i) {
        append_ok(wal, LogEntry::put("k" + std::to_string(i), "v"));
    }

    auto segs = segments(wal);
    ASSERT_EQ(segs.size(), 5u);
    for (std::size_t i = 0; i < segs.size(); ++i) {
        EXPECT_EQ(segs[i].first_sequence, i + 1);
    }

    std::vector<LogEntry> entries;
    ASSERT_FALSE(wal.read_all(entries));
    ASSERT_EQ(entries.size(), 5u);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].key(), "k" + std::to_string(i));
        EXPECT_EQ(entries[i].sequence(), i + 1);
    }
}

TEST_F(WALTest, RotatedLogReadsSameAsUnrotatedLog) {
    const std::filesystem::path other = test_dir_ / "unrotated";

    WAL small(options(200));
    WAL large(WalOptions{other, kDefaultSegmentSize});
    ASSERT_FALSE(small.open());
    ASSERT_FALSE(large.open());

    for (int i = 0; i < 40; ++i) {
        auto entry = (i % 3 == 2) ? LogEntry::del("k" + std::to_string(i - 1))
                                  : LogEntry::put("k" + std::to_string(i), "value");
        append_ok(small, entry);
        append_ok(large, entry);
    }
    EXPECT_GT(segments(small).size(), 1u);

    std::vector<LogEntry> a;
    std::vector<LogEntry> b;
    ASSERT_FALSE(small.read_all(a));
    ASSERT_FALSE(large.read_all(b));
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].sequence(), b[i].sequence());
        EXPECT_EQ(a[i].operation(), b[i].operation());
        EXPECT_EQ(a[i].key(), b[i].key());
        EXPECT_EQ(a[i].value(), b[i].value());
    }
}

TEST_F(WALTest, ReopenAppendsToNewestSegment) {
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        ASSERT_FALSE(wal.rotate());
        append_ok(wal, LogEntry::put("b", "2"));
    }

    WAL wal(options());
    ASSERT_FALSE(wal.open());
    EXPECT_EQ(append_ok(wal, LogEntry::put("c", "3")), 3u);
    EXPECT_EQ(segments(wal).size(), 2u);
}

TEST_F(WALTest, ReopenAfterRotationWithEmptyNewestSegment) {
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        append_ok(wal, LogEntry::put("b", "2"));
        ASSERT_FALSE(wal.rotate());
    }

    WAL wal(options());
    ASSERT_FALSE(wal.open());
    EXPECT_EQ(wal.next_sequence(), 3u);
}

// ── Segment removal ──────────────────────────────────────────────────────────

TEST_F(WALTest, RemoveSegmentsThroughDropsOnlyCoveredSealedSegments) {
    WAL wal(options());
    ASSERT_FALSE(wal.open());
    append_ok(wal, LogEntry::put("a", "1"));   // segment 1: 1..2
    append_ok(wal, LogEntry::put("b", "2"));
    ASSERT_FALSE(wal.rotate());
    append_ok(wal, LogEntry::put("c", "3"));   // segment 3: 3..4
    append_ok(wal, LogEntry::put("d", "4"));
    ASSERT_FALSE(wal.rotate());
    append_ok(wal, LogEntry::put("e", "5"));   // segment 5: current

    // Sequence 3 does not cover all of segment 3.
    ASSERT_FALSE(wal.remove_segments_through(3));
    auto segs = segments(wal);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0].first_sequence, 3u);

    // The current segment survives even when fully covered.
    ASSERT_FALSE(wal.remove_segments_through(100));
    segs = segments(wal);
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].first_sequence, 5u);

    std::vector<LogEntry> entries;
    ASSERT_FALSE(wal.read_all(entries));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].key(), "e");
}

TEST_F(WALTest, RemoveSegmentsThroughZeroKeepsEverything) {
    WAL wal(options());
    ASSERT_FALSE(wal.open());
    append_ok(wal, LogEntry::put("a", "1"));
    ASSERT_FALSE(wal.rotate());
    ASSERT_FALSE(wal.remove_segments_through(0));
    EXPECT_EQ(segments(wal).size(), 2u);
}

// ── Torn tail ────────────────────────────────────────────────────────────────

TEST_F(WALTest, TornTailIsIgnoredByReadAndCutOnOpen) {
    std::filesystem::path seg_path;
    uint64_t good_size = 0;
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        append_ok(wal, LogEntry::put("b", "2"));
        seg_path = segments(wal).back().path;
        good_size = wal.current_segment_size();
    }

    // Simulate a crash halfway through a third append.
    auto partial = LogEntry::put("c", "3").with_sequence(3).encode();
    partial.resize(partial.size() / 2);
    append_bytes(seg_path, std::string(partial.begin(), partial.end()));

    WAL reader(options());
    std::vector<LogEntry> entries;
    auto ec = reader.read_all(entries);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(entries.size(), 2u);

    WAL wal(options());
    ASSERT_FALSE(wal.open());
    EXPECT_EQ(std::filesystem::file_size(seg_path), good_size);
    EXPECT_EQ(wal.next_sequence(), 3u);
    EXPECT_EQ(append_ok(wal, LogEntry::put("c", "3")), 3u);

    ASSERT_FALSE(wal.read_all(entries));
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[2].key(), "c");
}

TEST_F(WALTest, GarbageTailIsTreatedAsTorn) {
    std::filesystem::path seg_path;
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        seg_path = segments(wal).back().path;
    }
    append_bytes(seg_path, "garbage!");

    WAL wal(options());
    ASSERT_FALSE(wal.open());
    std::vector<LogEntry> entries;
    ASSERT_FALSE(wal.read_all(entries));
    EXPECT_EQ(entries.size(), 1u);
    EXPECT_EQ(append_ok(wal, LogEntry::put("b", "2")), 2u);
}

TEST_F(WALTest, IncompleteHeaderOfNewestSegmentIsRepaired) {
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
    }
    // Crash right after creating the next segment file.
    append_bytes(wal_dir_ / WAL::segment_filename(2), "WAL");

    WAL wal(options());
    ASSERT_FALSE(wal.open());
    EXPECT_EQ(wal.next_sequence(), 2u);
    EXPECT_EQ(std::filesystem::file_size(wal_dir_ / WAL::segment_filename(2)),
              kSegmentHeaderSize);
    EXPECT_EQ(append_ok(wal, LogEntry::put("b", "2")), 2u);
}

// ── Corruption ───────────────────────────────────────────────────────────────

TEST_F(WALTest, MidStreamCorruptionInNewestSegmentFails) {
    std::filesystem::path seg_path;
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        append_ok(wal, LogEntry::put("b", "value-two"));
        append_ok(wal, LogEntry::put("c", "3"));
        seg_path = segments(wal).back().path;
    }

    // Flip the last value byte of the second record; the third stays valid.
    const auto first = LogEntry::put("a", "1").with_sequence(1).encode().size();
    const auto second = LogEntry::put("b", "value-two").with_sequence(2).encode().size();
    auto bytes = read_bytes(seg_path);
    bytes[kSegmentHeaderSize + first + second - kEntryTrailerSize - 1] ^= 0x20;
    write_bytes(seg_path, bytes);

    WAL reader(options());
    std::vector<LogEntry> entries;
    EXPECT_EQ(reader.read_all(entries), std::errc::illegal_byte_sequence);

    WAL wal(options());
    EXPECT_EQ(wal.open(), std::errc::illegal_byte_sequence);
    EXPECT_FALSE(wal.is_open());
    // Nothing was cut off.
    EXPECT_EQ(std::filesystem::file_size(seg_path), bytes.size());
}

TEST_F(WALTest, DamagedTailOfSealedSegmentFails) {
    std::filesystem::path sealed;
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        append_ok(wal, LogEntry::put("b", "2"));
        sealed = segments(wal).back().path;
        ASSERT_FALSE(wal.rotate());
        append_ok(wal, LogEntry::put("c", "3"));
    }

    std::filesystem::resize_file(sealed, std::filesystem::file_size(sealed) - 3);

    WAL reader(options());
    std::vector<LogEntry> entries;
    EXPECT_EQ(reader.read_all(entries), std::errc::illegal_byte_sequence);
}

TEST_F(WALTest, OutOfOrderSequencesAcrossSegmentsFail) {
    std::filesystem::create_directories(wal_dir_);
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        append_ok(wal, LogEntry::put("b", "2"));
    }

    // A later segment repeating sequence 2.
    std::vector<uint8_t> seg{'W', 'A', 'L', 'K', 'V',
                             static_cast<uint8_t>(kSegmentVersion & 0xFF),
                             static_cast<uint8_t>(kSegmentVersion >> 8)};
    auto dup = LogEntry::put("x", "y").with_sequence(2).encode();
    seg.insert(seg.end(), dup.begin(), dup.end());
    write_bytes(wal_dir_ / WAL::segment_filename(2), seg);

    WAL reader(options());
    std::vector<LogEntry> entries;
    EXPECT_EQ(reader.read_all(entries), std::errc::illegal_byte_sequence);
}

TEST_F(WALTest, OpenRejectsBadHeaderInSealedSegment) {
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        ASSERT_FALSE(wal.rotate());
        append_ok(wal, LogEntry::put("b", "2"));
    }

    auto bytes = read_bytes(wal_dir_ / WAL::segment_filename(1));
    bytes[0] = 'X';
    write_bytes(wal_dir_ / WAL::segment_filename(1), bytes);

    WAL wal(options());
    EXPECT_EQ(wal.open(), std::errc::invalid_argument);
}

TEST_F(WALTest, OpenRejectsSegmentSizeNotExceedingHeader) {
    WAL wal(options(kSegmentHeaderSize));
    EXPECT_EQ(wal.open(), std::errc::invalid_argument);
    EXPECT_FALSE(std::filesystem::exists(wal_dir_));
}

TEST_F(WALTest, DamagedLengthOfFirstRecordFailsWithoutTruncating) {
    std::filesystem::path seg_path;
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        append_ok(wal, LogEntry::put("b", "2"));
        append_ok(wal, LogEntry::put("c", "3"));
        seg_path = segments(wal).back().path;
    }

    // The length now claims far more bytes than the file holds, so the
    // damaged record looks like the start of a torn write.
    auto bytes = read_bytes(seg_path);
    bytes[kSegmentHeaderSize + 1] ^= 0x40;
    write_bytes(seg_path, bytes);

    WAL reader(options());
    std::vector<LogEntry> entries;
    EXPECT_EQ(reader.read_all(entries), std::errc::illegal_byte_sequence);

    WAL wal(options());
    EXPECT_EQ(wal.open(), std::errc::illegal_byte_sequence);
    EXPECT_FALSE(wal.is_open());
    EXPECT_EQ(read_bytes(seg_path), bytes);
}

TEST_F(WALTest, DamagedVersionOfMiddleRecordFailsWithoutTruncating) {
    std::filesystem::path seg_path;
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        append_ok(wal, LogEntry::put("b", "2"));
        append_ok(wal, LogEntry::put("c", "3"));
        seg_path = segments(wal).back().path;
    }

    const auto first = LogEntry::put("a", "1").with_sequence(1).encode().size();
    auto bytes = read_bytes(seg_path);
    bytes[kSegmentHeaderSize + first] = 0x7F;
    write_bytes(seg_path, bytes);

    WAL wal(options());
    EXPECT_EQ(wal.open(), std::errc::illegal_byte_sequence);
    EXPECT_EQ(std::filesystem::file_size(seg_path), bytes.size());
}

TEST_F(WALTest, DamagedLastRecordIsStillTreatedAsTorn) {
    std::filesystem::path seg_path;
    uint64_t good_size = 0;
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("a", "1"));
        good_size = wal.current_segment_size();
        append_ok(wal, LogEntry::put("b", "2"));
        seg_path = segments(wal).back().path;
    }

    auto bytes = read_bytes(seg_path);
    bytes[good_size + 1] ^= 0x40;
    write_bytes(seg_path, bytes);

    WAL wal(options());
    ASSERT_FALSE(wal.open());
    EXPECT_EQ(std::filesystem::file_size(seg_path), good_size);
    EXPECT_EQ(wal.next_sequence(), 2u);
}

// ── Compression ──────────────────────────────────────────────────────────────

TEST_F(WALTest, ZlibRecordsAreSmallerAndReadBack) {
    const std::string value(4096, 'z');
    {
        WAL wal(zlib_options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("big", value));
        append_ok(wal, LogEntry::del("big"));
        EXPECT_LT(wal.current_segment_size(),
                  kSegmentHeaderSize + LogEntry::put("big", value).encode().size());
    }

    WAL reader(options());
    std::vector<LogEntry> entries;
    ASSERT_FALSE(reader.read_all(entries));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].value(), value);
    EXPECT_EQ(entries[1].operation(), Operation::Delete);
}

TEST_F(WALTest, CompressionCanChangeBetweenOpens) {
    {
        WAL wal(options());
        ASSERT_FALSE(wal.open());
        append_ok(wal, LogEntry::put("plain", std::string(512, 'p')));
    }
    {
        WAL wal(zlib_options(9));
        ASSERT_FALSE(wal.open());
        EXPECT_EQ(append_ok(wal, LogEntry::put("packed", std::string(512, 'q'))), 2u);
    }

    WAL wal(options());
    ASSERT_FALSE(wal.open());
    std::vector<LogEntry> entries;
    ASSERT_FALSE(wal.read_all(entries));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].key(), "plain");
    EXPECT_EQ(entries[1].value(), std::string(512, 'q'));
}

TEST_F(WALTest, OpenRejectsCompressionLevelOutOfRange) {
    WAL wal(zlib_options(kMaxCompressionLevel + 1));
    EXPECT_EQ(wal.open(), std::errc::invalid_argument);
}

// ── Write failure ────────────────────────────────────────────────────────────

TEST_F(WALTest, FailedWriteRollsBackAndKeepsSequence) {
    WAL wal(options());
    ASSERT_FALSE(wal.open());
    append_ok(wal, LogEntry::put("a", "1"));
    const auto seg_path = segments(wal).back().path;
    const uint64_t good_size = wal.current_segment_size();

    {
        // Room for a few bytes of the next record, not all of it.
        FileSizeLimit limit(good_size + 8);
        ASSERT_TRUE(limit.applied());

        uint64_t seq = 0;
        EXPECT_EQ(wal.append(LogEntry::put("b", std::string(256, 'b')), seq),
                  std::errc::file_too_large);
    }

    EXPECT_EQ(std::filesystem::file_size(seg_path), good_size);
    EXPECT_EQ(wal.current_segment_size(), good_size);
    EXPECT_EQ(wal.next_sequence(), 2u);

    // The rollback succeeded, so the log keeps accepting appends.
    EXPECT_EQ(append_ok(wal, LogEntry::put("c", "3")), 2u);

    std::vector<LogEntry> entries;
    ASSERT_FALSE(wal.read_all(entries));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].key(), "c");
}

} // namespace walkv::persistence
