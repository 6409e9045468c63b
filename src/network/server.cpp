#include "network/server.hpp"
#include "network/session.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>
#include <utility>
#include <vector>

namespace walkv::network {

namespace {

boost::asio::ip::tcp::endpoint make_endpoint(const std::string& host, std::uint16_t port) {
    return {boost::asio::ip::make_address(host), port};
}

} // anonymous namespace

Server::Server(std::string host, std::uint16_t port, KeyValueStore& store,
               unsigned threads)
    : store_(store),
      threads_(std::max(1u, threads)),
      ioc_(static_cast<int>(threads_)),
      acceptor_(ioc_, make_endpoint(host, port), /*reuse_address=*/true) {
    spdlog::info("Server: listening on {}:{} with {} worker thread(s)",
                 host, local_port(), threads_);
}

std::uint16_t Server::local_port() const {
    return acceptor_.local_endpoint().port();
}

void Server::run() {
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: signal {} received", signo);
            stop();
        }
    });

    boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);

    std::vector<std::thread> workers;
    workers.reserve(threads_ - 1);
    for (unsigned i = 1; i < threads_; ++i) {
        workers.emplace_back([this] { ioc_.run(); });
    }
    ioc_.run();
    for (auto& worker : workers) {
        worker.join();
    }

    spdlog::info("Server: stopped ({} session(s) were still open)", active_.load());
}

void Server::stop() {
    // The acceptor is only touched from the io_context.
    boost::asio::post(ioc_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        ioc_.stop();
    });
}

boost::asio::awaitable<void> Server::accept_loop() {
    for (;;) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec == boost::asio::error::operation_aborted) {
            co_return;
        }
        if (ec) {
            spdlog::warn("Server: accept failed: {}", ec.message());
            co_return;
        }

        // One response line per request; don't hold it back for coalescing.
        socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);

        boost::asio::co_spawn(ioc_, serve(std::move(socket)), boost::asio::detached);
    }
}

boost::asio::awaitable<void> Server::serve(boost::asio::ip::tcp::socket socket) {
    const std::size_t open = ++active_;
    spdlog::debug("Server: session opened ({} active)", open);

    Session session{std::move(socket), store_};
    co_await session.run();

    const std::size_t remaining = --active_;
    spdlog::debug("Server: session closed ({} active)", remaining);
}

} // namespace walkv::network
