#include <exception>
#include <iostream>
#include <string>

#include <boost/system/system_error.hpp>

#include "Errors.hpp"
#include "GameConfig.hpp"
#include "Lobby.hpp"
#include "Logger.hpp"
#include "TcpServer.hpp"
#include "UnoRoom.hpp"

int main(int argc, char** argv) {
    GameConfig cfg;
    try {
        cfg = GameConfig::from_args(argc, argv);
        if (cfg.help) {
            std::cout << GameConfig::usage(argv[0]);
            return 0;
        }
        cfg.validate();
    }
    catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n" << GameConfig::usage(argv[0]);
        return 2;
    }

    if (cfg.quiet)
        logging::set_quiet();
    logging::set_verbose(cfg.verbose);

    try {
        TcpServer server(cfg.host, cfg.port, cfg.max_connections);
        Lobby lobby(server);

        lobby.await_connect(cfg.max_connections, cfg.connect_timeout);
        auto users = lobby.await_usernames(cfg.name_timeout);

        UnoRoom<TcpServer> room(server, users, cfg.ai_players, cfg.resolve_seed(), cfg.ai_delay_unit);
        room.run();

        server.close_all();
    }
    catch (const UnoError& e) {
        logging::elog().write(websocketpp::log::elevel::fatal, e.what());
        return 1;
    }
    catch (const boost::system::system_error& e) {
        logging::elog().write(websocketpp::log::elevel::fatal, std::string("Network error: ") + e.what());
        return 1;
    }
    catch (const std::exception& e) {
        logging::elog().write(websocketpp::log::elevel::fatal, e.what());
        return 1;
    }
}
