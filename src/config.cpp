#include "config.h"
#include "fs.h"
#include "logger.h"
#include <nlohmann/json.hpp>

// Config module logging macros
#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace peerdrop {

namespace {

bool is_valid_port(int port) {
    return port > 0 && port <= 65535;
}

} // namespace

bool parse_relay_config(const std::string& text, RelayConfig& out) {
    RelayConfig config;

    try {
        nlohmann::json json = nlohmann::json::parse(text);
        if (!json.is_object()) {
            LOG_CONFIG_ERROR("Relay configuration must be a JSON object");
            return false;
        }

        config.listen_port = json.value("listen_port", config.listen_port);
        config.backlog = json.value("backlog", config.backlog);
        config.log_level = json.value("log_level", config.log_level);

        if (json.contains("users")) {
            for (const auto& entry : json.at("users")) {
                RelayUser user;
                user.token = entry.at("token").get<std::string>();
                user.identity.user_id = entry.at("id").get<std::string>();
                user.identity.username = entry.value("username", user.identity.user_id);
                user.identity.email = entry.value("email", "");
                config.users.push_back(user);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse relay configuration: " << e.what());
        return false;
    }

    if (!is_valid_port(config.listen_port) || config.backlog <= 0) {
        LOG_CONFIG_ERROR("Invalid relay listen_port " << config.listen_port << " or backlog " << config.backlog);
        return false;
    }
    if (config.users.empty()) {
        LOG_CONFIG_WARN("Relay configuration has no users, every connection will be rejected");
    }

    out = config;
    return true;
}

bool parse_endpoint_config(const std::string& text, EndpointConfig& out) {
    EndpointConfig config;

    try {
        nlohmann::json json = nlohmann::json::parse(text);
        if (!json.is_object()) {
            LOG_CONFIG_ERROR("Endpoint configuration must be a JSON object");
            return false;
        }

        config.relay_host = json.value("relay_host", config.relay_host);
        config.relay_port = json.value("relay_port", config.relay_port);
        config.token = json.value("token", config.token);
        config.chunk_size = json.value("chunk_size", config.chunk_size);
        config.negotiation_timeout_ms = json.value("negotiation_timeout_ms", config.negotiation_timeout_ms);
        config.max_active_transfers = json.value("max_active_transfers", config.max_active_transfers);
        config.send_high_water_mark = json.value("send_high_water_mark", config.send_high_water_mark);
        config.send_low_water_mark = json.value("send_low_water_mark", config.send_low_water_mark);
        config.download_directory = json.value("download_directory", config.download_directory);
        config.connect_timeout_ms = json.value("connect_timeout_ms", config.connect_timeout_ms);
        config.log_level = json.value("log_level", config.log_level);
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse endpoint configuration: " << e.what());
        return false;
    }

    if (config.token.empty()) {
        LOG_CONFIG_ERROR("Endpoint configuration requires a token");
        return false;
    }
    if (!is_valid_port(config.relay_port)) {
        LOG_CONFIG_ERROR("Invalid relay_port " << config.relay_port);
        return false;
    }
    if (config.chunk_size == 0 || config.chunk_size > MAX_CHUNK_SIZE) {
        LOG_CONFIG_ERROR("chunk_size must be between 1 and " << MAX_CHUNK_SIZE);
        return false;
    }
    if (config.negotiation_timeout_ms <= 0 || config.max_active_transfers == 0) {
        LOG_CONFIG_ERROR("negotiation_timeout_ms and max_active_transfers must be positive");
        return false;
    }
    if (config.send_low_water_mark >= config.send_high_water_mark) {
        LOG_CONFIG_ERROR("send_low_water_mark must be below send_high_water_mark");
        return false;
    }

    out = config;
    return true;
}

bool load_relay_config(const std::string& path, RelayConfig& out) {
    if (!file_exists(path)) {
        LOG_CONFIG_ERROR("Relay configuration not found: " << path);
        return false;
    }

    LOG_CONFIG_INFO("Loading relay configuration from " << path);
    auto content = read_file_text(path);
    if (!content) {
        return false;
    }
    return parse_relay_config(*content, out);
}

bool load_endpoint_config(const std::string& path, EndpointConfig& out) {
    if (!file_exists(path)) {
        LOG_CONFIG_ERROR("Endpoint configuration not found: " << path);
        return false;
    }

    LOG_CONFIG_INFO("Loading endpoint configuration from " << path);
    auto content = read_file_text(path);
    if (!content) {
        return false;
    }
    return parse_endpoint_config(*content, out);
}

bool save_endpoint_config(const std::string& path, const EndpointConfig& config) {
    try {
        nlohmann::json json;
        json["relay_host"] = config.relay_host;
        json["relay_port"] = config.relay_port;
        json["token"] = config.token;
        json["chunk_size"] = config.chunk_size;
        json["negotiation_timeout_ms"] = config.negotiation_timeout_ms;
        json["max_active_transfers"] = config.max_active_transfers;
        json["send_high_water_mark"] = config.send_high_water_mark;
        json["send_low_water_mark"] = config.send_low_water_mark;
        json["download_directory"] = config.download_directory;
        json["connect_timeout_ms"] = config.connect_timeout_ms;
        json["log_level"] = config.log_level;

        if (!create_file(path, json.dump(4))) {
            LOG_CONFIG_ERROR("Failed to write endpoint configuration to " << path);
            return false;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to serialize endpoint configuration: " << e.what());
        return false;
    }

    LOG_CONFIG_DEBUG("Saved endpoint configuration to " << path);
    return true;
}

std::shared_ptr<StaticIdentityResolver> make_identity_resolver(const RelayConfig& config) {
    auto resolver = std::make_shared<StaticIdentityResolver>();
    for (const auto& user : config.users) {
        resolver->add_user(user.token, user.identity);
    }
    return resolver;
}

} // namespace peerdrop
