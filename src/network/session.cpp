#include "network/session.hpp"
#include "network/protocol.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <type_traits>
#include <variant>

namespace walkv::network {

namespace {

using boost::asio::redirect_error;
using boost::asio::use_awaitable;

ErrorResp storage_error(const std::error_code& ec) {
    return ErrorResp{"storage failure: " + ec.message()};
}

} // namespace

Session::Session(boost::asio::ip::tcp::socket socket, KeyValueStore& store)
    : socket_(std::move(socket)), store_(store) {}

boost::asio::awaitable<void> Session::run() {
    const auto remote = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = socket_.remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    spdlog::debug("Session::run() - client connected from {}", remote);

    std::string buf;
    buf.reserve(256);

    for (;;) {
        // Read one newline-delimited line.
        boost::system::error_code ec;
        const std::size_t n = co_await boost::asio::async_read_until(
            socket_, boost::asio::dynamic_buffer(buf), '\n',
            redirect_error(use_awaitable, ec));

        if (ec) {
            if (ec != boost::asio::error::eof &&
                ec != boost::asio::error::connection_reset) {
                spdlog::warn("Session {}: read error: {}", remote, ec.message());
            }
            break;
        }

        // Extract the line (everything up to and including '\n').
        std::string line = buf.substr(0, n - 1); // strip the '\n'
        buf.erase(0, n);

        spdlog::debug("Session {}: recv '{}'", remote, line);

        Response response;
        auto parse_result = parse_command(line);
        if (auto* err = std::get_if<ErrorResp>(&parse_result)) {
            response = std::move(*err);
        } else {
            response = dispatch(store_, std::get<Command>(parse_result));
        }

        // Serialize and send.
        const std::string wire = serialize_response(response);
        spdlog::debug("Session {}: send '{}'", remote, wire.substr(0, wire.size() - 1));

        boost::system::error_code wec;
        co_await boost::asio::async_write(
            socket_, boost::asio::buffer(wire), redirect_error(use_awaitable, wec));

        if (wec) {
            spdlog::warn("Session {}: write error: {}", remote, wec.message());
            break;
        }

        if (std::holds_alternative<ByeResp>(response)) {
            break;
        }
    }

    boost::system::error_code close_ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, close_ec);
    socket_.close(close_ec);

    spdlog::debug("Session::run() - client disconnected: {}", remote);
}

Response Session::dispatch(KeyValueStore& store, const Command& cmd) {
    return std::visit(
        [&](const auto& c) -> Response {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, PingCmd>) {
                return PongResp{};

            } else if constexpr (std::is_same_v<T, GetCmd>) {
                auto val = store.get(c.key);
                if (!val.has_value()) {
                    return NotFoundResp{};
                }
                return ValueResp{std::move(*val)};

            } else if constexpr (std::is_same_v<T, PutCmd>) {
                if (auto ec = store.put(c.key, c.value)) {
                    spdlog::error("PUT {} failed: {}", c.key, ec.message());
                    return storage_error(ec);
                }
                return OkResp{};

            } else if constexpr (std::is_same_v<T, DeleteCmd>) {
                bool removed = false;
                if (auto ec = store.del(c.key, &removed)) {
                    spdlog::error("DELETE {} failed: {}", c.key, ec.message());
                    return storage_error(ec);
                }
                if (!removed) {
                    return NotFoundResp{};
                }
                return DeletedResp{};

            } else if constexpr (std::is_same_v<T, KeysCmd>) {
                return KeysResp{store.keys()};

            } else if constexpr (std::is_same_v<T, CheckpointCmd>) {
                if (auto ec = store.checkpoint()) {
                    spdlog::error("CHECKPOINT failed: {}", ec.message());
                    return storage_error(ec);
                }
                return OkResp{};

            } else if constexpr (std::is_same_v<T, CompactCmd>) {
                if (auto ec = store.compact()) {
                    spdlog::error("COMPACT failed: {}", ec.message());
                    return storage_error(ec);
                }
                return OkResp{};

            } else if constexpr (std::is_same_v<T, QuitCmd>) {
                return ByeResp{};
            }
        },
        cmd);
}

} // namespace walkv::network
