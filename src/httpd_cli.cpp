//
//  httpd_cli.cpp
//  uttt-httpd - Command-line interface implementation
//

#include "httpd_cli.hpp"
#include "uttt.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <span>

namespace uttt::httpd {

const char* cli_error_to_string(CliError error) {
    switch (error) {
        case CliError::InvalidArgument:
            return "Invalid argument";
        case CliError::MissingValue:
            return "Missing value for argument";
        case CliError::InvalidPort:
            return "Invalid port number (must be 1-65535)";
        case CliError::InvalidThreads:
            return "Invalid thread count (must be 1-64)";
        case CliError::InvalidBudget:
            return "Invalid AI budget (must be 50-10000 ms)";
        case CliError::InvalidInterval:
            return "Invalid interval";
        case CliError::InvalidSeed:
            return "Invalid seed";
        case CliError::HelpRequested:
            return "Help requested";
        default:
            return "Unknown error";
    }
}

namespace {

template<typename T>
std::expected<T, CliError> parse_number(std::string_view str) {
    T value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::unexpected(CliError::InvalidArgument);
    }

    return value;
}

/**
 * Parses an integer flag value and checks it against `valid`.
 */
template<typename Valid>
std::expected<int, CliError> bounded_int(std::string_view flag, std::string_view value,
                                         Valid valid, CliError error) {
    auto parsed = parse_number<int>(value);
    if (!parsed) {
        std::cerr << std::format("Error: Invalid {} value '{}'\n", flag, value);
        return std::unexpected(error);
    }
    if (!valid(*parsed)) {
        std::cerr << std::format("Error: {} {} out of range\n", flag, *parsed);
        return std::unexpected(error);
    }
    return *parsed;
}

} // namespace

void print_help(std::string_view program_name) {
    std::cout << std::format(R"(
uttt-httpd - Ultimate Tic-Tac-Toe room server

USAGE:
    {} [OPTIONS]

OPTIONS:
    -h, --help                Show this help message
    -v, --version             Show version information
    -p, --port <PORT>         TCP port to bind to (default: 5600)
    -H, --host <HOST>         IP address to bind to (default: 0.0.0.0)
    -t, --threads <COUNT>     AI rollout worker threads (default: CPU cores - 1)
    -b, --ai-budget-ms <MS>   AI thinking time per move (default: 2500, range: 50-10000)
    -d, --data-dir <DIR>      Directory for player and match records (default: uttt_data)
    -a, --accounts <FILE>     JSON file of registered accounts
    --sweep-ms <MS>           Server-side timeout sweep interval, 0 disables (default: 1000)
    --idle-ms <MS>            Drop connections not polled for this long (default: 60000)
    --seed <N>                Seed every random generator (deterministic runs)
    --daemon                  Run as daemon (detach from TTY)
    --foreground              Run in foreground (default behavior)
    --verbose                 Enable verbose logging

ENDPOINTS:
    POST /uttt/v1/connect     Open a connection as a registered user or guest
    POST /uttt/v1/events      Send a client event
    GET  /uttt/v1/poll        Long-poll queued server events
    POST /uttt/v1/disconnect  Close a connection
    GET  /uttt/v1/status      Server health, rooms and metrics
    GET  /health              Liveness check

EXAMPLES:
    {} --port 8080 --threads 4 --ai-budget-ms 1000
    {} --host 127.0.0.1 --accounts users.json --daemon --verbose

)", program_name, program_name, program_name);
}

void print_version() {
    std::cout << std::format("uttt-httpd version {}\n", GAME_VERSION);
    std::cout << "C++23 Ultimate Tic-Tac-Toe room server\n";
}

std::expected<HttpDaemonConfig, CliError> parse_command_line(int argc, char* argv[]) {
    HttpDaemonConfig config;

    std::span<char*> args(argv, argc);

    for (size_t i = 1; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (arg == "-h" || arg == "--help") {
            print_help(args[0]);
            return std::unexpected(CliError::HelpRequested);
        }

        if (arg == "-v" || arg == "--version") {
            print_version();
            return std::unexpected(CliError::HelpRequested);
        }

        if (arg == "--daemon") {
            config.daemon_mode = true;
            continue;
        }

        if (arg == "--foreground") {
            config.foreground_mode = true;
            continue;
        }

        if (arg == "--verbose") {
            config.verbose = true;
            continue;
        }

        // Arguments that require values
        if (i + 1 >= args.size()) {
            std::cerr << std::format("Error: {} requires a value\n", arg);
            return std::unexpected(CliError::MissingValue);
        }

        std::string_view value = args[i + 1];
        ++i;

        if (arg == "-p" || arg == "--port") {
            auto port = bounded_int("port", value, is_valid_port, CliError::InvalidPort);
            if (!port) return std::unexpected(port.error());
            config.port = *port;
            continue;
        }

        if (arg == "-H" || arg == "--host") {
            config.host = value;
            continue;
        }

        if (arg == "-t" || arg == "--threads") {
            auto threads = bounded_int("threads", value, is_valid_threads, CliError::InvalidThreads);
            if (!threads) return std::unexpected(threads.error());
            config.threads = *threads;
            continue;
        }

        if (arg == "-b" || arg == "--ai-budget-ms") {
            auto budget = bounded_int("AI budget", value, is_valid_ai_budget, CliError::InvalidBudget);
            if (!budget) return std::unexpected(budget.error());
            config.ai_budget_ms = *budget;
            continue;
        }

        if (arg == "-d" || arg == "--data-dir") {
            config.data_dir = value;
            continue;
        }

        if (arg == "-a" || arg == "--accounts") {
            config.accounts_file = std::string(value);
            continue;
        }

        if (arg == "--sweep-ms") {
            auto sweep = bounded_int("sweep interval", value, is_valid_sweep_interval, CliError::InvalidInterval);
            if (!sweep) return std::unexpected(sweep.error());
            config.sweep_ms = *sweep;
            continue;
        }

        if (arg == "--idle-ms") {
            auto idle = bounded_int("idle window", value, is_valid_idle_window, CliError::InvalidInterval);
            if (!idle) return std::unexpected(idle.error());
            config.idle_ms = *idle;
            continue;
        }

        if (arg == "--seed") {
            auto seed = parse_number<uint64_t>(value);
            if (!seed) {
                std::cerr << std::format("Error: Invalid seed '{}'\n", value);
                return std::unexpected(CliError::InvalidSeed);
            }
            config.seed = *seed;
            continue;
        }

        std::cerr << std::format("Error: Unknown argument '{}'\n", arg);
        return std::unexpected(CliError::InvalidArgument);
    }

    return config;
}

} // namespace uttt::httpd
