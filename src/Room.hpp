#ifndef ROOM_HPP
#define ROOM_HPP

#include <string>
#include <vector>

#include "Responsor.hpp"

struct UserInfo {
    unsigned    conn_id;
    std::string user_name;
};

// The people who made it through registration, in connection order.
// Membership never changes once the room exists.
template <typename Transport>
class Room :public Responsor<Transport> {
protected:
    const std::vector<UserInfo> connections;

public:
    Room(Transport& transport, const std::vector<UserInfo>& members)
        :Responsor<Transport>(transport), connections(members) {}

    int get_num_of_people() const {
        return static_cast<int>(this->connections.size());
    }

    std::vector<unsigned> get_conn_ids() const {
        std::vector<unsigned> ids;
        ids.reserve(connections.size());
        for (auto& user : connections)
            ids.push_back(user.conn_id);
        return ids;
    }

    using Responsor<Transport>::broadcast;

    void broadcast(const std::string& text) {
        broadcast(get_conn_ids(), text);
    }
};

#endif
