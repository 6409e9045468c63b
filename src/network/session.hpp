#pragma once

#include "network/protocol.hpp"
#include "storage/kv_store.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <string>

namespace walkv::network {

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() and runs until the
// client disconnects, sends QUIT, or an I/O error occurs.  Commands are
// newline-delimited text lines; each gets exactly one response line.
//
// Mutating commands block the calling io_context thread for the WAL flush;
// the server runs a thread pool so other sessions keep being served.
class Session {
public:
    Session(boost::asio::ip::tcp::socket socket, KeyValueStore& store);

    // Main coroutine.  Loops reading commands, dispatching to the store, and
    // sending responses.  Returns when the connection closes.
    boost::asio::awaitable<void> run();

    // Execute a parsed Command against the store and return the Response.
    // Exposed for tests; never throws.
    [[nodiscard]] static Response dispatch(KeyValueStore& store, const Command& cmd);

private:
    boost::asio::ip::tcp::socket socket_;
    KeyValueStore& store_;
};

} // namespace walkv::network
