#ifndef TCP_SERVER_HPP
#define TCP_SERVER_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "Errors.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"

namespace asio = boost::asio;
using asio::ip::tcp;

struct Connection {
    tcp::socket socket;
    std::string address;    // ip:port of the peer

    explicit Connection(tcp::socket socket, std::string address)
        :socket(std::move(socket)), address(std::move(address)) {}
};

// Owns the listening socket and every accepted peer. Connections are
// addressed by an id handed out in accept order.
//
// Everything runs on the caller's thread. The only waits that service
// several sockets at once are accept_until() and receive_each_until(), both
// bounded by an absolute deadline on the steady clock.
class TcpServer {
public:
    typedef std::chrono::steady_clock::time_point time_point;

private:
    asio::io_context io;
    tcp::acceptor acceptor;
    std::map<unsigned, std::unique_ptr<Connection>> connections;
    unsigned next_conn_id = 0;

public:
    TcpServer(const std::string& host, std::uint16_t port, unsigned backlog)
        :acceptor(io) {
        tcp::endpoint endpoint(asio::ip::make_address(host), port);
        acceptor.open(endpoint.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen(static_cast<int>(backlog));
        logging::elog().write(websocketpp::log::elevel::info,
            "Listening on " + host + ":" + std::to_string(get_port()));
    }

    ~TcpServer() {
        close_all();
    }

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    std::uint16_t get_port() const {
        return acceptor.local_endpoint().port();
    }

    // Accepts until `max` peers are connected in total or the deadline
    // passes. on_accept(conn_id) runs for each new peer.
    template <typename OnAccept>
    void accept_until(std::size_t max, time_point deadline, OnAccept on_accept) {
        if (connections.size() >= max)
            return;

        io.restart();
        bool expired = false;
        tcp::socket pending(io);

        std::function<void()> start_accept;
        std::function<void(const boost::system::error_code&)> handle_accept =
            [&](const boost::system::error_code& ec) {
                if (ec == asio::error::operation_aborted)
                    return;
                if (ec) {
                    logging::elog().write(websocketpp::log::elevel::warn,
                        "Failed to accept a connection: " + ec.message());
                }
                else if (expired) {
                    // completed while we were cancelling, too late to join
                    boost::system::error_code ignored;
                    pending.close(ignored);
                    pending = tcp::socket(io);
                    return;
                }
                else {
                    unsigned conn_id = adopt(std::move(pending));
                    pending = tcp::socket(io);
                    on_accept(conn_id);
                }
                if (connections.size() < max && !expired)
                    start_accept();
            };
        start_accept = [&]() {
            acceptor.async_accept(pending, handle_accept);
        };

        start_accept();
        while (connections.size() < max && std::chrono::steady_clock::now() < deadline)
            io.run_one_until(deadline);

        expired = true;
        acceptor.cancel();
        io.restart();
        io.run();
    }

    // Starts one read on every socket in `ids` and hands each chunk to
    // on_receive(conn_id, text) as it arrives. Returns the ids that had not
    // sent anything by the deadline, in the order given.
    template <typename OnReceive>
    std::vector<unsigned> receive_each_until(const std::vector<unsigned>& ids, time_point deadline, OnReceive on_receive) {
        struct PendingRead {
            unsigned conn_id;
            std::array<char, Protocol::max_chunk> buffer;
            bool done = false;
        };
        std::vector<std::unique_ptr<PendingRead>> reads;
        std::size_t remaining = ids.size();
        bool expired = false;

        io.restart();
        for (auto conn_id : ids) {
            reads.push_back(std::make_unique<PendingRead>());
            PendingRead* read = reads.back().get();
            read->conn_id = conn_id;
            connection(conn_id).socket.async_read_some(
                asio::buffer(read->buffer),
                [&, read](const boost::system::error_code& ec, std::size_t n) {
                    if (ec == asio::error::operation_aborted || expired)
                        return;
                    if (ec)
                        throw PeerDisconnected(read->conn_id,
                            connection(read->conn_id).address + " disconnected: " + ec.message());
                    read->done = true;
                    --remaining;
                    on_receive(read->conn_id, Protocol::decode(read->buffer.data(), n));
                }
            );
        }

        // Outstanding reads point into `reads`, so they are cancelled and
        // drained before leaving, on the error path too
        auto abandon_pending = [&]() {
            expired = true;
            for (auto& read : reads)
                if (!read->done) {
                    auto it = connections.find(read->conn_id);
                    if (it != connections.end()) {
                        boost::system::error_code ignored;
                        it->second->socket.cancel(ignored);
                    }
                }
            io.restart();
            io.run();
        };

        try {
            while (remaining > 0 && std::chrono::steady_clock::now() < deadline)
                io.run_one_until(deadline);
        }
        catch (const PeerDisconnected&) {
            abandon_pending();
            throw;
        }
        abandon_pending();

        std::vector<unsigned> silent;
        for (auto& read : reads)
            if (!read->done)
                silent.push_back(read->conn_id);
        return silent;
    }

    void send(unsigned conn_id, const std::string& payload) {
        auto& conn = connection(conn_id);
        boost::system::error_code ec;
        asio::write(conn.socket, asio::buffer(payload), ec);
        if (ec)
            throw PeerDisconnected(conn_id, conn.address + " disconnected: " + ec.message());
    }

    // One blocking read of at most Protocol::max_chunk bytes. No framing:
    // whatever the peer sent in one go is one message.
    std::string receive(unsigned conn_id) {
        auto& conn = connection(conn_id);
        std::array<char, Protocol::max_chunk> buffer;
        boost::system::error_code ec;
        std::size_t n = conn.socket.read_some(asio::buffer(buffer), ec);
        if (ec)
            throw PeerDisconnected(conn_id, conn.address + " disconnected: " + ec.message());
        return std::string(buffer.data(), n);
    }

    void close(unsigned conn_id) {
        auto it = connections.find(conn_id);
        if (it == connections.end())
            return;
        boost::system::error_code ec;
        it->second->socket.shutdown(tcp::socket::shutdown_both, ec);
        it->second->socket.close(ec);
        logging::alog().write(websocketpp::log::alevel::disconnect, it->second->address + " closed");
        connections.erase(it);
    }

    void close_all() {
        while (!connections.empty())
            close(connections.begin()->first);
        if (acceptor.is_open()) {
            boost::system::error_code ec;
            acceptor.close(ec);
        }
    }

    const std::string& peer_address(unsigned conn_id) {
        return connection(conn_id).address;
    }

    std::size_t get_num_of_connections() const {
        return connections.size();
    }

private:
    Connection& connection(unsigned conn_id) {
        auto it = connections.find(conn_id);
        if (it == connections.end())
            throw PeerDisconnected(conn_id, "connection " + std::to_string(conn_id) + " is closed");
        return *it->second;
    }

    unsigned adopt(tcp::socket socket) {
        boost::system::error_code ec;
        auto remote = socket.remote_endpoint(ec);
        std::string address = ec ? std::string("<unknown>") :
            remote.address().to_string() + ":" + std::to_string(remote.port());

        unsigned conn_id = ++next_conn_id;
        connections.emplace(conn_id, std::make_unique<Connection>(std::move(socket), address));
        logging::alog().write(websocketpp::log::alevel::connect, address + " connected");
        return conn_id;
    }
};

#endif
