/**
 * @file client_main.cpp
 * @brief peerdrop: interactive file-transfer endpoint
 *
 * Usage:
 *   peerdrop <config.json>
 *   peerdrop --init <config.json> <token>    # write a default configuration
 */

#include "config.h"
#include "event_loop.h"
#include "logger.h"
#include "signaling_client.h"
#include "socket.h"
#include "tcp_peer_connection.h"
#include "transfer_endpoint.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

using namespace peerdrop;

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json>\n"
              << "       " << program << " --init <config.json> <token>\n"
              << "\n"
              << "  config.json   Endpoint configuration (relay_host, relay_port, token, ...)\n"
              << "  --init        Write a configuration with default settings and exit\n";
}

static void print_help() {
    std::cout << "\nAvailable commands:\n";
    std::cout << "  help                    - Show this help message\n";
    std::cout << "  join <room>             - Join a room (leaves the current one)\n";
    std::cout << "  leave                   - Leave the current room\n";
    std::cout << "  peers                   - List the other users in the room\n";
    std::cout << "  send <user_id> <path>   - Offer a file to a user\n";
    std::cout << "  accept <transfer_id>    - Accept an incoming transfer\n";
    std::cout << "  reject <transfer_id>    - Reject an incoming transfer\n";
    std::cout << "  cancel <transfer_id>    - Abandon a transfer\n";
    std::cout << "  transfers               - Show active and recent transfers\n";
    std::cout << "  quit                    - Exit the program\n";
}

static void print_transfer(const Transfer& transfer) {
    std::cout << "  " << transfer.transfer_id
              << " " << transfer_direction_to_string(transfer.direction)
              << " " << transfer.file_name << " (" << transfer.file_size << " bytes)"
              << " peer " << transfer.peer_id()
              << " " << transfer_state_to_string(transfer.state)
              << " " << transfer.progress << "%";
    if (!transfer.error_message.empty()) {
        std::cout << " - " << transfer.error_message;
    }
    std::cout << "\n";
}

static void install_callbacks(TransferEndpoint& endpoint) {
    endpoint.set_room_joined_callback([](const std::string& room_id) {
        std::cout << "Joined room " << room_id << std::endl;
    });

    endpoint.set_room_left_callback([](const std::string& room_id) {
        std::cout << "Left room " << room_id << std::endl;
    });

    endpoint.set_room_users_callback([](const std::string& room_id, const std::vector<Identity>& users) {
        std::cout << "Users in " << room_id << ":";
        if (users.empty()) {
            std::cout << " (nobody else)";
        }
        for (const auto& user : users) {
            std::cout << " " << user.user_id << "(" << user.username << ")";
        }
        std::cout << std::endl;
    });

    endpoint.set_incoming_request_callback([](const Transfer& transfer) {
        std::cout << "Incoming transfer " << transfer.transfer_id << " from " << transfer.sender_id
                  << ": " << transfer.file_name << " (" << transfer.file_size << " bytes, " << transfer.file_type << ")\n"
                  << "  accept " << transfer.transfer_id << "  |  reject " << transfer.transfer_id << std::endl;
    });

    // Print progress in 10% steps
    auto last_printed = std::make_shared<std::unordered_map<std::string, int>>();
    endpoint.set_progress_callback([last_printed](const Transfer& transfer) {
        int step = transfer.progress / 10;
        auto it = last_printed->find(transfer.transfer_id);
        if (it != last_printed->end() && it->second == step) {
            return;
        }
        (*last_printed)[transfer.transfer_id] = step;
        std::cout << "[" << transfer.transfer_id.substr(0, 8) << "] " << transfer.file_name
                  << " " << transfer.progress << "%" << std::endl;
        if (transfer.is_terminal()) {
            last_printed->erase(transfer.transfer_id);
        }
    });

    endpoint.set_completed_callback([](const Transfer& transfer, const std::string& artifact_path) {
        if (transfer.direction == TransferDirection::INCOMING) {
            std::cout << "Received " << transfer.file_name << " -> " << artifact_path << std::endl;
        } else {
            std::cout << "Sent " << transfer.file_name << " to " << transfer.receiver_id << std::endl;
        }
    });

    endpoint.set_rejected_callback([](const Transfer& transfer) {
        std::cout << "Transfer " << transfer.transfer_id << " of " << transfer.file_name
                  << " was rejected (" << transfer.error_message << ")" << std::endl;
    });

    endpoint.set_failed_callback([](const Transfer& transfer) {
        std::cout << "Transfer " << transfer.transfer_id << " of " << transfer.file_name
                  << " failed: " << transfer.error_message << std::endl;
    });
}

static int write_default_config(const std::string& path, const std::string& token) {
    EndpointConfig config;
    config.token = token;
    if (!save_endpoint_config(path, config)) {
        std::cerr << "Error: could not write " << path << "\n";
        return 1;
    }
    std::cout << "Wrote " << path << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc == 4 && std::string(argv[1]) == "--init") {
        return write_default_config(argv[2], argv[3]);
    }
    if (argc != 2) {
        print_usage(argv[0]);
        return 1;
    }

    EndpointConfig config;
    if (!load_endpoint_config(argv[1], config)) {
        std::cerr << "Error: could not load endpoint configuration from " << argv[1] << "\n";
        return 1;
    }
    Logger::getInstance().set_log_level(parse_log_level(config.log_level));
    // stdout belongs to the command console
    Logger::getInstance().set_destination(LogDestination::STDERR);

    std::signal(SIGINT, signal_handler);
#ifndef _WIN32
    std::signal(SIGTERM, signal_handler);
#endif

    if (!init_socket_library()) {
        LOG_MAIN_ERROR("Failed to initialize socket library");
        return 1;
    }

    EventLoop loop;
    SignalingClient client(loop);
    TransferEndpoint endpoint(loop, client, std::make_shared<TcpPeerConnectionFactory>(), config);
    install_callbacks(endpoint);

    client.set_message_callback([&endpoint](const nlohmann::json& message) {
        endpoint.handle_signaling_message(message);
    });
    client.set_closed_callback([&endpoint]() {
        endpoint.handle_signaling_closed();
        std::cout << "Disconnected from relay. Type 'quit' to exit." << std::endl;
    });

    LOG_MAIN_INFO("Connecting to relay " << config.relay_host << ":" << config.relay_port << "...");
    if (!client.connect(config.relay_host, config.relay_port, config.token, config.connect_timeout_ms)) {
        LOG_MAIN_ERROR("Could not authenticate with relay " << config.relay_host << ":" << config.relay_port);
        cleanup_socket_library();
        return 1;
    }
    endpoint.set_local_identity(client.get_identity());

    std::thread loop_thread([&loop]() { loop.run(); });

    std::cout << "Connected as " << client.get_identity().username
              << " (id " << client.get_identity().user_id << ")\n";
    print_help();

    std::string input;
    while (g_running && std::getline(std::cin, input)) {
        std::istringstream iss(input);
        std::string command;
        iss >> command;
        if (command.empty()) {
            continue;
        }

        if (command == "quit" || command == "exit") {
            break;
        } else if (command == "help") {
            print_help();
        } else if (command == "join") {
            std::string room_id;
            iss >> room_id;
            if (room_id.empty()) {
                std::cout << "Usage: join <room>" << std::endl;
                continue;
            }
            loop.post([&endpoint, room_id]() { endpoint.join_room(room_id); });
        } else if (command == "leave") {
            loop.post([&endpoint]() { endpoint.leave_room(); });
        } else if (command == "peers") {
            loop.post([&endpoint]() {
                const auto& peers = endpoint.get_peers();
                std::cout << "Room '" << endpoint.get_current_room() << "': " << peers.size() << " other users\n";
                for (const auto& peer : peers) {
                    std::cout << "  " << peer.user_id << "  " << peer.username << "  " << peer.email << "\n";
                }
                std::cout << std::flush;
            });
        } else if (command == "send") {
            std::string user_id;
            std::string path;
            iss >> user_id;
            std::getline(iss >> std::ws, path);
            if (user_id.empty() || path.empty()) {
                std::cout << "Usage: send <user_id> <path>" << std::endl;
                continue;
            }
            loop.post([&endpoint, user_id, path]() {
                std::string transfer_id = endpoint.send_file(user_id, path);
                if (transfer_id.empty()) {
                    std::cout << "Could not send " << path << std::endl;
                } else {
                    std::cout << "Requested transfer " << transfer_id << ", waiting for " << user_id << std::endl;
                }
            });
        } else if (command == "accept" || command == "reject" || command == "cancel") {
            std::string transfer_id;
            iss >> transfer_id;
            if (transfer_id.empty()) {
                std::cout << "Usage: " << command << " <transfer_id>" << std::endl;
                continue;
            }
            loop.post([&endpoint, command, transfer_id]() {
                bool ok = command == "accept" ? endpoint.accept_transfer(transfer_id)
                        : command == "reject" ? endpoint.reject_transfer(transfer_id)
                        : endpoint.cancel_transfer(transfer_id);
                if (!ok) {
                    std::cout << "No matching transfer " << transfer_id << std::endl;
                }
            });
        } else if (command == "transfers") {
            loop.post([&endpoint]() {
                auto active = endpoint.get_transfers();
                auto finished = endpoint.get_finished_transfers();
                std::cout << "Active transfers: " << active.size() << "\n";
                for (const auto& transfer : active) {
                    print_transfer(transfer);
                }
                std::cout << "Recent transfers: " << finished.size() << "\n";
                for (const auto& transfer : finished) {
                    print_transfer(transfer);
                }
                std::cout << std::flush;
            });
        } else {
            std::cout << "Unknown command: " << command << "\n"
                      << "Type 'help' for available commands." << std::endl;
        }
    }

    LOG_MAIN_INFO("Shutting down...");
    client.disconnect();
    loop.stop();
    loop_thread.join();
    cleanup_socket_library();
    return 0;
}
