#ifndef RESPONSOR_HPP
#define RESPONSOR_HPP

#include <iostream>
#include <string>
#include <vector>

#include "Protocol.hpp"

// Transport must provide
//   void        send(unsigned conn_id, const std::string& payload);
//   std::string receive(unsigned conn_id);   // blocking, one raw chunk
// and throw PeerDisconnected when the peer is gone.
template <typename Transport>
class Responsor {
protected:
    Transport& transport;
    std::ostream* status_out = &std::cout;

public:
    Responsor(Transport& transport) :transport(transport) {}

    void set_status_stream(std::ostream& out) {
        status_out = &out;
    }

    // Every status line also ends up on the server's own output
    void broadcast(const std::vector<unsigned>& targets, const std::string& text) {
        *status_out << text << std::endl;
        std::string payload = Protocol::encode(Protocol::MESSAGE, text);
        for (auto conn_id : targets)
            transport.send(conn_id, payload);
    }

    void send_user(unsigned conn_id, const std::string& text) {
        transport.send(conn_id, Protocol::encode(Protocol::MESSAGE, text));
    }

    void send_error(unsigned conn_id, const std::string& text) {
        transport.send(conn_id, Protocol::encode(Protocol::ERROR, text));
    }

    // Blocks the caller until this one peer answers
    std::string send_input(unsigned conn_id, const std::string& prompt) {
        transport.send(conn_id, Protocol::encode(Protocol::INPUT, prompt));
        std::string chunk = transport.receive(conn_id);
        return Protocol::decode(chunk.data(), chunk.size());
    }
};

#endif
