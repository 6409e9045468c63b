#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace walkv {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of a single client command.  Each command type is a
// plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct PutCmd {
    std::string key;
    std::string value;
};

struct GetCmd {
    std::string key;
};

struct DeleteCmd {
    std::string key;
};

struct KeysCmd {};

struct PingCmd {};

struct CheckpointCmd {};

struct CompactCmd {};

struct QuitCmd {};

using Command = std::variant<PutCmd, GetCmd, DeleteCmd, KeysCmd, PingCmd,
                             CheckpointCmd, CompactCmd, QuitCmd>;

// ── Responses ─────────────────────────────────────────────────────────────────

struct OkResp {};
struct PongResp {};
struct NotFoundResp {};
struct DeletedResp {};
struct ByeResp {};

struct ValueResp {
    std::string value;
};

struct KeysResp {
    std::vector<std::string> keys;
};

struct ErrorResp {
    std::string message;
};

using Response =
    std::variant<OkResp, PongResp, NotFoundResp, DeletedResp, ByeResp, ValueResp,
                 KeysResp, ErrorResp>;

// ── Protocol ──────────────────────────────────────────────────────────────────

namespace network {

// Stateless helper: parse one line (without the trailing '\n') into a Command.
// Returns ErrorResp-producing variant on malformed input, so callers can
// directly serialize the error back to the client.
//
// Verbs: PING, GET k, PUT k v (alias SET), DELETE k (alias DEL), KEYS,
// CHECKPOINT, COMPACT, QUIT. The PUT value is the rest of the line.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, ErrorResp> parse_command(std::string_view line);

// Serialize a Response into a wire-ready string (always ends with '\n').
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string serialize_response(const Response& response);

} // namespace network
} // namespace walkv
