#pragma once

#include "identity.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace peerdrop {

/**
 * Token table entry of the relay configuration
 */
struct RelayUser {
    std::string token;
    Identity identity;
};

struct RelayConfig {
    int listen_port = 8765;
    int backlog = 16;
    std::string log_level = "info";
    std::vector<RelayUser> users;
};

struct EndpointConfig {
    std::string relay_host = "127.0.0.1";
    int relay_port = 8765;
    std::string token;
    size_t chunk_size = 16384;
    int negotiation_timeout_ms = 20000;
    size_t max_active_transfers = 1;
    size_t send_high_water_mark = 1024 * 1024;
    size_t send_low_water_mark = 256 * 1024;
    std::string download_directory = "./downloads";
    int connect_timeout_ms = 5000;
    std::string log_level = "info";
};

/// Largest chunk an endpoint may be configured to send
constexpr size_t MAX_CHUNK_SIZE = 256 * 1024;

/**
 * Load relay configuration from a JSON file. Missing keys keep their defaults.
 * @return false if the file is missing, unparsable or holds invalid values
 */
bool load_relay_config(const std::string& path, RelayConfig& out);

/**
 * Load endpoint configuration from a JSON file. Missing keys keep their
 * defaults; "token" is required.
 * @return false if the file is missing, unparsable or holds invalid values
 */
bool load_endpoint_config(const std::string& path, EndpointConfig& out);

/**
 * Write endpoint configuration as pretty-printed JSON.
 */
bool save_endpoint_config(const std::string& path, const EndpointConfig& config);

// Same as the load functions, from JSON text
bool parse_relay_config(const std::string& text, RelayConfig& out);
bool parse_endpoint_config(const std::string& text, EndpointConfig& out);

/**
 * Token resolver populated from the relay's user table
 */
std::shared_ptr<StaticIdentityResolver> make_identity_resolver(const RelayConfig& config);

} // namespace peerdrop
