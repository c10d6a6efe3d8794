//
//  httpd_cli.hpp
//  uttt-httpd - Command-line interface for the room server
//
//  C++23 CLI parsing with std::expected
//

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace uttt::httpd {

enum class CliError {
    InvalidArgument,
    MissingValue,
    InvalidPort,
    InvalidThreads,
    InvalidBudget,
    InvalidInterval,
    InvalidSeed,
    HelpRequested
};

struct HttpDaemonConfig {
    std::string host = "0.0.0.0";
    int port = 5600;
    int threads = []() {
        auto cores = static_cast<int>(std::thread::hardware_concurrency());
        return cores > 1 ? cores - 1 : 1;
    }();
    int ai_budget_ms = 2500;
    std::string data_dir = "uttt_data";
    std::optional<std::string> accounts_file;
    int sweep_ms = 1000;     // 0 disables the server-side timeout sweep
    int idle_ms = 60000;
    std::optional<uint64_t> seed;
    bool daemon_mode = false;
    bool foreground_mode = false;
    bool verbose = false;
};

constexpr bool is_valid_port(int port) noexcept {
    return port >= 1 && port <= 65535;
}

constexpr bool is_valid_threads(int threads) noexcept {
    return threads >= 1 && threads <= 64;
}

constexpr bool is_valid_ai_budget(int ms) noexcept {
    return ms >= 50 && ms <= 10000;
}

constexpr bool is_valid_sweep_interval(int ms) noexcept {
    return ms >= 0 && ms <= 60000;
}

constexpr bool is_valid_idle_window(int ms) noexcept {
    return ms >= 1000 && ms <= 3600000;
}

std::expected<HttpDaemonConfig, CliError> parse_command_line(int argc, char* argv[]);

void print_help(std::string_view program_name);
void print_version();

const char* cli_error_to_string(CliError error);

} // namespace uttt::httpd
