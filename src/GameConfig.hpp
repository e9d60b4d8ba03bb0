#ifndef GAME_CONFIG_HPP
#define GAME_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <string>

#include "Errors.hpp"
#include "Uno.hpp"

struct GameConfig {
    unsigned                  max_connections = 1;
    std::chrono::seconds      connect_timeout{ 60 };
    std::chrono::seconds      name_timeout{ 60 };
    int                       ai_players = 5;
    std::string               host = "0.0.0.0";
    std::uint16_t             port = 5555;
    std::chrono::milliseconds ai_delay_unit{ 1000 };
    std::optional<std::uint32_t> seed;
    bool                      verbose = false;
    bool                      quiet = false;
    bool                      help = false;

    static std::string usage(const std::string& program) {
        return "Usage: " + program + " [options]\n"
            "  --max-players N       maximum number of human players (default 1)\n"
            "  --connect-timeout S   seconds to wait for connections (default 60)\n"
            "  --name-timeout S      seconds to wait for names (default 60)\n"
            "  --ai N                number of AI players (default 5)\n"
            "  --host ADDR           listen address (default 0.0.0.0)\n"
            "  --port P              listen port (default 5555)\n"
            "  --ai-delay MS         length of one AI thinking step (default 1000)\n"
            "  --seed N              seed for shuffling and AI decisions\n"
            "  --verbose             log AI decisions\n"
            "  --quiet               log errors only\n";
    }

    // Signed so that "-3" is reported as negative rather than as garbage
    static long long parse_integer(const std::string& flag, const std::string& value) {
        if (value.empty())
            throw ConfigurationError(flag + " expects an integer");
        std::size_t i = value[0] == '-' || value[0] == '+' ? 1 : 0;
        if (i == value.size())
            throw ConfigurationError(flag + " expects an integer, got '" + value + "'");
        for (; i < value.size(); ++i)
            if (value[i] < '0' || value[i] > '9')
                throw ConfigurationError(flag + " expects an integer, got '" + value + "'");
        try {
            return std::stoll(value);
        }
        catch (const std::out_of_range&) {
            throw ConfigurationError(flag + " is out of range: " + value);
        }
    }

    static long long parse_in_range(const std::string& flag, const std::string& value, long long lo, long long hi) {
        long long n = parse_integer(flag, value);
        if (n < lo || n > hi)
            throw ConfigurationError(flag + " must be between " + std::to_string(lo) +
                " and " + std::to_string(hi) + ", got " + value);
        return n;
    }

    static GameConfig from_args(int argc, const char* const* argv) {
        GameConfig cfg;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto next = [&]() -> std::string {
                if (i + 1 >= argc)
                    throw ConfigurationError(arg + " expects a value");
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h")
                cfg.help = true;
            else if (arg == "--verbose")
                cfg.verbose = true;
            else if (arg == "--quiet")
                cfg.quiet = true;
            else if (arg == "--max-players")
                cfg.max_connections = static_cast<unsigned>(
                    parse_in_range(arg, next(), 0, std::numeric_limits<int>::max()));
            else if (arg == "--connect-timeout")
                cfg.connect_timeout = std::chrono::seconds(
                    parse_in_range(arg, next(), 0, std::numeric_limits<int>::max()));
            else if (arg == "--name-timeout")
                cfg.name_timeout = std::chrono::seconds(
                    parse_in_range(arg, next(), 0, std::numeric_limits<int>::max()));
            else if (arg == "--ai")
                cfg.ai_players = static_cast<int>(
                    parse_in_range(arg, next(), std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
            else if (arg == "--host")
                cfg.host = next();
            else if (arg == "--port")
                cfg.port = static_cast<std::uint16_t>(parse_in_range(arg, next(), 0, 65535));
            else if (arg == "--ai-delay")
                cfg.ai_delay_unit = std::chrono::milliseconds(
                    parse_in_range(arg, next(), 0, std::numeric_limits<int>::max()));
            else if (arg == "--seed")
                cfg.seed = static_cast<std::uint32_t>(
                    parse_in_range(arg, next(), 0, std::numeric_limits<std::uint32_t>::max()));
            else
                throw ConfigurationError("unknown option " + arg);
        }
        return cfg;
    }

    // Runs before any socket exists. Every seat may be taken, so the deck
    // has to cover max_connections humans.
    void validate() const {
        if (max_connections == 0)
            throw ConfigurationError("--max-players must be at least 1");
        if (host.empty())
            throw ConfigurationError("--host must not be empty");
        Uno::check_player_count(max_connections, ai_players);
    }

    std::mt19937::result_type resolve_seed() const {
        if (seed)
            return *seed;
        return std::random_device{}();
    }
};

#endif
