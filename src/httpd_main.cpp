//
//  httpd_main.cpp
//  uttt-httpd - HTTP daemon main entry point
//
//  Ultimate Tic-Tac-Toe room server
//

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <thread>
#include <unistd.h>

#include "httpd_cli.hpp"
#include "httpd_server.hpp"
#include "util/log.hpp"

namespace uttt::httpd {

volatile sig_atomic_t shutdown_requested = 0;

void signal_handler(int) {
    shutdown_requested = 1;
}

void setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler);
    signal(SIGPIPE, SIG_IGN);
}

bool daemonize() {
    pid_t pid = fork();

    if (pid < 0) {
        std::cerr << "Fork failed\n";
        return false;
    }

    if (pid > 0) {
        // Parent process exits
        exit(0);
    }

    if (setsid() < 0) {
        std::cerr << "Failed to create new session\n";
        return false;
    }

    // Fork again to ensure we can't acquire a controlling terminal
    pid = fork();
    if (pid < 0) {
        std::cerr << "Second fork failed\n";
        return false;
    }

    if (pid > 0) {
        exit(0);
    }

    // The data directory and accounts file stay relative to the launch
    // directory, so the working directory is kept.
    close(STDIN_FILENO);
    close(STDOUT_FILENO);
    close(STDERR_FILENO);

    return true;
}

} // namespace uttt::httpd

using namespace uttt::httpd;

int main(int argc, char* argv[]) {
    try {
        auto config = parse_command_line(argc, argv);
        if (!config) {
            return config.error() == CliError::HelpRequested ? 0 : 1;
        }

        uttt::log::set_level(config->verbose ? uttt::log::Level::Debug : uttt::log::Level::Info);

        if (config->daemon_mode && !config->foreground_mode) {
            std::cout << std::format("Starting uttt-httpd in daemon mode on {}:{}\n",
                                     config->host, config->port);

            if (!daemonize()) {
                std::cerr << "Failed to daemonize\n";
                return 1;
            }
        } else {
            uttt::log::info("Starting uttt-httpd on {}:{} with {} AI workers, {} ms budget",
                            config->host, config->port, config->threads, config->ai_budget_ms);
        }

        setup_signal_handlers();

        HttpServer server(*config);
        if (!server.start()) {
            uttt::log::error("Failed to start HTTP server");
            return 1;
        }

        while (!shutdown_requested && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        uttt::log::info("Shutting down server...");
        server.stop();

        return 0;

    } catch (const std::exception& e) {
        std::cerr << std::format("Error: {}\n", e.what());
        return 1;
    }
}
