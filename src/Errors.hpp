#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

class UnoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad AI count, too many players for one deck, malformed command line
class ConfigurationError : public UnoError {
public:
    using UnoError::UnoError;
};

// Nobody connected before the connect deadline
class NoParticipants : public UnoError {
public:
    using UnoError::UnoError;
};

// Nobody sent a name before the naming deadline
class NoNames : public UnoError {
public:
    using UnoError::UnoError;
};

// A registered peer closed its socket or a read/write on it failed.
// Not recovered anywhere: one disconnect ends the whole game.
class PeerDisconnected : public UnoError {
    unsigned conn_id;

public:
    PeerDisconnected(unsigned conn_id, const std::string& what)
        :UnoError(what), conn_id(conn_id) {}

    unsigned get_conn_id() const {
        return conn_id;
    }
};

#endif
