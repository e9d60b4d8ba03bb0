#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <websocketpp/concurrency/basic.hpp>
#include <websocketpp/logger/basic.hpp>
#include <websocketpp/logger/levels.hpp>

typedef websocketpp::log::basic<websocketpp::concurrency::basic, websocketpp::log::elevel> basic_elog;
typedef websocketpp::log::basic<websocketpp::concurrency::basic, websocketpp::log::alevel> basic_alog;

namespace logging {

static constexpr websocketpp::log::level error_channels =
    websocketpp::log::elevel::info |
    websocketpp::log::elevel::warn |
    websocketpp::log::elevel::rerror |
    websocketpp::log::elevel::fatal;

static constexpr websocketpp::log::level access_channels =
    websocketpp::log::alevel::connect |
    websocketpp::log::alevel::disconnect |
    websocketpp::log::alevel::app;

// Shared by every component so that --verbose and --quiet reach all of them
inline basic_elog& elog() {
    static basic_elog instance(websocketpp::log::channel_type_hint::error);
    static bool initialized = false;
    if (!initialized) {
        instance.set_channels(error_channels);
        initialized = true;
    }
    return instance;
}

inline basic_alog& alog() {
    static basic_alog instance(websocketpp::log::channel_type_hint::access);
    static bool initialized = false;
    if (!initialized) {
        instance.set_channels(access_channels);
        initialized = true;
    }
    return instance;
}

// devel carries the AI's reasoning
inline void set_verbose(bool verbose) {
    if (verbose)
        elog().set_channels(websocketpp::log::elevel::devel);
    else
        elog().clear_channels(websocketpp::log::elevel::devel);
}

inline void set_quiet() {
    elog().clear_channels(websocketpp::log::elevel::all);
    elog().set_channels(websocketpp::log::elevel::rerror | websocketpp::log::elevel::fatal);
    alog().clear_channels(websocketpp::log::alevel::all);
}

}

#endif
