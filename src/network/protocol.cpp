#include "network/protocol.hpp"

#include <string>
#include <utility>

namespace walkv::network {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

// Split `line` on the first space, returning {head, rest}.
// If there is no space, rest is empty.
std::pair<std::string_view, std::string_view> split_once(std::string_view line) {
    const auto pos = line.find(' ');
    if (pos == std::string_view::npos) {
        return {line, {}};
    }
    return {line.substr(0, pos), line.substr(pos + 1)};
}

// Parse the single-key argument of GET / DELETE.
std::variant<std::string, ErrorResp> single_key(std::string_view verb,
                                                std::string_view rest) {
    if (rest.empty()) {
        return ErrorResp{std::string(verb) + " requires a key"};
    }
    // The key must be a single token (no embedded spaces allowed).
    auto [key, extra] = split_once(rest);
    if (key.empty() || !extra.empty()) {
        return ErrorResp{std::string(verb) + " takes exactly one argument"};
    }
    return std::string(key);
}

} // namespace

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ErrorResp> parse_command(std::string_view line) {
    // Strip trailing '\r' so the parser is CRLF-tolerant.
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    if (line.empty()) {
        return ErrorResp{"empty command"};
    }

    auto [verb, rest] = split_once(line);

    // ── No-argument verbs ─────────────────────────────────────────────────────
    if (verb == "PING" || verb == "KEYS" || verb == "CHECKPOINT" ||
        verb == "COMPACT" || verb == "QUIT") {
        if (!rest.empty()) {
            return ErrorResp{std::string(verb) + " takes no arguments"};
        }
        if (verb == "PING") return PingCmd{};
        if (verb == "KEYS") return KeysCmd{};
        if (verb == "CHECKPOINT") return CheckpointCmd{};
        if (verb == "COMPACT") return CompactCmd{};
        return QuitCmd{};
    }

    // ── GET key ───────────────────────────────────────────────────────────────
    if (verb == "GET") {
        auto key = single_key(verb, rest);
        if (auto* err = std::get_if<ErrorResp>(&key)) {
            return std::move(*err);
        }
        return GetCmd{std::get<std::string>(std::move(key))};
    }

    // ── DELETE key ────────────────────────────────────────────────────────────
    if (verb == "DELETE" || verb == "DEL") {
        auto key = single_key(verb, rest);
        if (auto* err = std::get_if<ErrorResp>(&key)) {
            return std::move(*err);
        }
        return DeleteCmd{std::get<std::string>(std::move(key))};
    }

    // ── PUT key value ─────────────────────────────────────────────────────────
    //
    // The value is everything after "PUT <key> "; it may contain spaces.
    if (verb == "PUT" || verb == "SET") {
        if (rest.empty()) {
            return ErrorResp{std::string(verb) + " requires a key and a value"};
        }
        auto [key, value] = split_once(rest);
        if (key.empty()) {
            return ErrorResp{std::string(verb) + ": key must not be empty"};
        }
        if (value.empty()) {
            return ErrorResp{std::string(verb) + " requires a value"};
        }
        return PutCmd{std::string(key), std::string(value)};
    }

    return ErrorResp{"unknown command: " + std::string(verb)};
}

// ── serialize_response ────────────────────────────────────────────────────────

std::string serialize_response(const Response& response) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, OkResp>) {
                return "OK\n";
            } else if constexpr (std::is_same_v<T, PongResp>) {
                return "PONG\n";
            } else if constexpr (std::is_same_v<T, NotFoundResp>) {
                return "NOT_FOUND\n";
            } else if constexpr (std::is_same_v<T, DeletedResp>) {
                return "DELETED\n";
            } else if constexpr (std::is_same_v<T, ByeResp>) {
                return "BYE\n";
            } else if constexpr (std::is_same_v<T, ValueResp>) {
                return "VALUE " + r.value + "\n";
            } else if constexpr (std::is_same_v<T, KeysResp>) {
                if (r.keys.empty()) {
                    return "KEYS\n";
                }
                std::string out = "KEYS";
                for (const auto& k : r.keys) {
                    out += ' ';
                    out += k;
                }
                out += '\n';
                return out;
            } else if constexpr (std::is_same_v<T, ErrorResp>) {
                return "ERROR " + r.message + "\n";
            }
        },
        response);
}

} // namespace walkv::network
