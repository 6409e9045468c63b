#pragma once

#include "storage/kv_store.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace walkv::network {

// TCP front end of one KeyValueStore.
//
//   Server srv{"0.0.0.0", 6380, store, 4};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
//
// The store must already be open and recovered. A WAL flush blocks the
// worker thread that runs the session, so `threads` bounds how many
// mutations can wait on the disk at once.
class Server {
public:
    // Binds and listens immediately. Port 0 picks an ephemeral port.
    Server(std::string host, std::uint16_t port, KeyValueStore& store,
           unsigned threads = 1);

    // Serves connections on `threads` workers (the caller is one of them).
    void run();

    // Safe from any thread, before or during run().
    void stop();

    [[nodiscard]] std::uint16_t local_port() const;

    // Connections currently being served.
    [[nodiscard]] std::size_t active_sessions() const noexcept { return active_.load(); }

private:
    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> serve(boost::asio::ip::tcp::socket socket);

    KeyValueStore& store_;
    unsigned threads_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;

    std::atomic<std::size_t> active_{0};
};

} // namespace walkv::network
