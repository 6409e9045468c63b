#include "common/logger.hpp"
#include "network/protocol.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/program_options.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <variant>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* kUsage =
    "Commands:\n"
    "  PING\n"
    "  GET <key>\n"
    "  PUT <key> <value>      (alias SET; value is the rest of the line)\n"
    "  DELETE <key>           (alias DEL)\n"
    "  KEYS\n"
    "  CHECKPOINT\n"
    "  COMPACT\n"
    "  QUIT\n"
    "Verbs are case-insensitive here; the server expects upper case.\n";

// Blocking line-oriented connection to a walkv-server.
class Connection {
public:
    Connection() : socket_(ioc_) {}

    boost::system::error_code connect(const std::string& host, std::uint16_t port) {
        boost::system::error_code ec;
        tcp::resolver resolver{ioc_};
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (!ec) {
            asio::connect(socket_, endpoints, ec);
        }
        if (!ec) {
            socket_.set_option(tcp::no_delay(true), ec);
        }
        return ec;
    }

    // Send one request line and wait for its single response line.
    boost::system::error_code round_trip(const std::string& request, std::string& response) {
        boost::system::error_code ec;
        const std::string line = request + "\n";
        asio::write(socket_, asio::buffer(line), ec);
        if (ec) return ec;

        const std::size_t n = asio::read_until(socket_, asio::dynamic_buffer(buf_), '\n', ec);
        if (ec) return ec;

        response = buf_.substr(0, n - 1);
        buf_.erase(0, n);
        return {};
    }

private:
    asio::io_context ioc_;
    tcp::socket socket_;
    std::string buf_;
};

// Upper-case the verb and check the line with the server's own parser, so a
// malformed command never reaches the network. Returns the line to send, or
// std::nullopt after printing the local error.
std::optional<std::string> prepare(const std::string& input) {
    std::string line = input;
    const auto verb_end = std::min(line.find(' '), line.size());
    std::transform(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(verb_end),
                   line.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto parsed = walkv::network::parse_command(line);
    if (auto* err = std::get_if<walkv::ErrorResp>(&parsed)) {
        fprintf(stdout, "ERROR %s\n", err->message.c_str());
        return std::nullopt;
    }
    return line;
}

// Returns the process exit code.
int run_once(Connection& conn, const std::string& command) {
    auto line = prepare(command);
    if (!line) return 1;

    std::string response;
    if (auto ec = conn.round_trip(*line, response)) {
        spdlog::error("walkv-cli: {}", ec.message());
        return 1;
    }
    fprintf(stdout, "%s\n", response.c_str());
    return response.rfind("ERROR", 0) == 0 ? 1 : 0;
}

int repl(Connection& conn) {
    std::string input;
    for (;;) {
        fprintf(stdout, "walkv> ");
        fflush(stdout);

        if (!std::getline(std::cin, input)) {
            fprintf(stdout, "\n");
            return 0;
        }
        if (input.empty()) continue;
        if (input == "help" || input == "HELP") {
            fputs(kUsage, stdout);
            continue;
        }

        auto line = prepare(input);
        if (!line) continue;

        std::string response;
        if (auto ec = conn.round_trip(*line, response)) {
            if (ec == asio::error::eof) {
                fprintf(stdout, "Server disconnected.\n");
                return 0;
            }
            spdlog::error("walkv-cli: {}", ec.message());
            return 1;
        }
        fprintf(stdout, "%s\n", response.c_str());

        if (response == "BYE") return 0;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    po::options_description desc("walkv-cli options");
    desc.add_options()
        ("help,h", "Show this help")
        ("host", po::value<std::string>()->default_value("127.0.0.1"), "Server host")
        ("port,p", po::value<std::uint16_t>()->default_value(6380), "Server port")
        ("command,c", po::value<std::string>(), "Run one command, print the reply and exit")
        ("log-level,l", po::value<std::string>()->default_value("warn"), "Log level");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc << '\n' << kUsage;
        fprintf(stdout, "%s", oss.str().c_str());
        return 0;
    }

    const auto host = vm["host"].as<std::string>();
    const auto port = vm["port"].as<std::uint16_t>();
    walkv::init_default_logger(walkv::parse_log_level(vm["log-level"].as<std::string>()));

    Connection conn;
    if (auto ec = conn.connect(host, port)) {
        spdlog::error("walkv-cli: cannot connect to {}:{}: {}", host, port, ec.message());
        return 1;
    }

    if (vm.count("command")) {
        return run_once(conn, vm["command"].as<std::string>());
    }

    fprintf(stdout, "Connected to %s:%u. Type 'help' for commands, Ctrl+D to quit.\n",
            host.c_str(), static_cast<unsigned>(port));
    return repl(conn);
}
