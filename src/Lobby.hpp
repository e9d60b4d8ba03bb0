#ifndef LOBBY_HPP
#define LOBBY_HPP

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "Logger.hpp"
#include "Responsor.hpp"
#include "Room.hpp"
#include "TcpServer.hpp"

// Registration: first collect connections, then a name from each of them.
// Both phases run against their own absolute deadline.
class Lobby :public Responsor<TcpServer> {
    std::vector<unsigned> connected;

public:
    Lobby(TcpServer& server) :Responsor<TcpServer>(server) {}

    std::vector<unsigned> await_connect(unsigned max_connections, std::chrono::seconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        transport.accept_until(max_connections, deadline, [this](unsigned conn_id) {
            connected.push_back(conn_id);
            broadcast(connected, transport.peer_address(conn_id) + " connected!");
        });

        if (connected.empty())
            throw NoParticipants("Nobody connected!");
        return connected;
    }

    // Peers that stay silent past the deadline are told so and dropped
    std::vector<UserInfo> await_usernames(std::chrono::seconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        const std::vector<unsigned> everyone = connected;
        std::vector<std::pair<unsigned, std::string>> named;

        std::vector<unsigned> silent = transport.receive_each_until(connected, deadline,
            [&](unsigned conn_id, const std::string& name) {
                named.emplace_back(conn_id, name);
                broadcast(everyone, transport.peer_address(conn_id) + " has chosen name " + name + "!");
            });

        for (auto conn_id : silent)
            evict(conn_id);
        connected.clear();

        if (named.empty())
            throw NoNames("Nobody sent a name!");

        // Seats follow connection order, not the order the names came in
        std::vector<UserInfo> users;
        for (auto conn_id : everyone) {
            auto it = std::find_if(named.begin(), named.end(),
                [conn_id](const std::pair<unsigned, std::string>& n) { return n.first == conn_id; });
            if (it != named.end())
                users.push_back(UserInfo{ it->first, it->second });
        }
        return users;
    }

private:
    void evict(unsigned conn_id) {
        logging::elog().write(websocketpp::log::elevel::warn,
            transport.peer_address(conn_id) + " did not send a name in time");
        try {
            send_error(conn_id, "You didn't send a name in time!");
        }
        catch (const PeerDisconnected& e) {
            logging::elog().write(websocketpp::log::elevel::warn, e.what());
        }
        transport.close(conn_id);
    }
};

#endif
