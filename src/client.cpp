#include <array>
#include <cstdint>
#include <iostream>
#include <string>

#include <boost/asio.hpp>

#include "Errors.hpp"
#include "GameConfig.hpp"
#include "Protocol.hpp"

namespace asio = boost::asio;
using asio::ip::tcp;

namespace {

struct ClientConfig {
    std::string host = "localhost";
    std::uint16_t port = 5555;
    std::string name = "Henry";
};

ClientConfig parse_args(int argc, char** argv) {
    ClientConfig cfg;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc)
            throw ConfigurationError(arg + " expects a value");
        if (arg == "--host")
            cfg.host = argv[++i];
        else if (arg == "--port")
            cfg.port = static_cast<std::uint16_t>(GameConfig::parse_in_range(arg, argv[++i], 0, 65535));
        else if (arg == "--name")
            cfg.name = argv[++i];
        else
            throw ConfigurationError("unknown option " + arg);
    }
    if (cfg.name.empty())
        throw ConfigurationError("--name must not be empty");
    return cfg;
}

// Returns false once the server has rejected us
bool handle(tcp::socket& socket, const std::string& line) {
    Protocol::MessageKind kind;
    std::string text;
    if (!Protocol::parse(line, kind, text)) {
        std::cerr << "Ignoring malformed line from server: " << line << std::endl;
        return true;
    }

    switch (kind) {
    case Protocol::MESSAGE:
        std::cout << text << std::endl;
        return true;
    case Protocol::ERROR:
        std::cerr << text << std::endl;
        return false;
    case Protocol::INPUT: {
        std::cout << text << std::flush;
        std::string response;
        if (!std::getline(std::cin, response))
            response = "DRAW";
        // One chunk per answer; the server strips the newline, and an
        // empty answer still reaches it
        asio::write(socket, asio::buffer(response + "\n"));
        return true;
    }
    }
    return true;
}

}

int main(int argc, char** argv) {
    ClientConfig cfg;
    try {
        cfg = parse_args(argc, argv);
    }
    catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n"
            << "Usage: " << argv[0] << " [--host HOST] [--port P] [--name NAME]\n";
        return 2;
    }

    try {
        asio::io_context io;
        tcp::socket socket(io);
        tcp::resolver resolver(io);
        asio::connect(socket, resolver.resolve(cfg.host, std::to_string(cfg.port)));

        asio::write(socket, asio::buffer(cfg.name));

        LineBuffer lines;
        std::array<char, 4096> buffer;
        while (true) {
            boost::system::error_code ec;
            std::size_t n = socket.read_some(asio::buffer(buffer), ec);
            if (ec == asio::error::eof || ec == asio::error::connection_reset)
                break;
            if (ec)
                throw boost::system::system_error(ec);

            for (auto& line : lines.feed(buffer.data(), n))
                if (!handle(socket, line))
                    return 1;
        }
        if (!lines.empty())
            std::cerr << "Connection closed in the middle of a line" << std::endl;
    }
    catch (const std::exception& e) {
        std::cerr << "Connection error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Game over!" << std::endl;
    return 0;
}
