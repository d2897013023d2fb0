/**
 * @file relay_main.cpp
 * @brief peerdrop-relay: signaling relay server
 *
 * Usage:
 *   peerdrop-relay <config.json>
 *
 * The configuration names the listen port and the token table:
 *   {
 *       "listen_port": 8765,
 *       "log_level": "info",
 *       "users": [ {"token": "alice-token", "id": "1", "username": "alice", "email": "alice@example.com"} ]
 *   }
 */

#include "config.h"
#include "logger.h"
#include "signaling_server.h"
#include "socket.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// Main module logging macros
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

using namespace peerdrop;

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json>\n"
              << "\n"
              << "  config.json   Relay configuration (listen_port, backlog, log_level, users)\n";
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        print_usage(argv[0]);
        return 1;
    }

    RelayConfig config;
    if (!load_relay_config(argv[1], config)) {
        std::cerr << "Error: could not load relay configuration from " << argv[1] << "\n";
        return 1;
    }
    Logger::getInstance().set_log_level(parse_log_level(config.log_level));

    std::signal(SIGINT, signal_handler);
#ifndef _WIN32
    std::signal(SIGTERM, signal_handler);
#endif

    if (!init_socket_library()) {
        LOG_MAIN_ERROR("Failed to initialize socket library");
        return 1;
    }

    SignalingServer server(config.listen_port, make_identity_resolver(config), config.backlog);
    if (!server.start()) {
        LOG_MAIN_ERROR("Failed to start relay on port " << config.listen_port);
        cleanup_socket_library();
        return 1;
    }

    LOG_MAIN_INFO("Relay listening on port " << server.get_listen_port() << " with "
                  << config.users.size() << " known users. Press Ctrl+C to quit.");

    while (g_running && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_MAIN_INFO("Shutting down...");
    server.stop();
    cleanup_socket_library();
    return 0;
}
