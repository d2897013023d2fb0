#pragma once

#include <string>
#include <vector>

namespace peerdrop {
namespace network_utils {

/**
 * Resolve a hostname to an IPv4 address.
 * An IPv4 literal is returned unchanged.
 * @return Dotted-quad address, or empty string on error
 */
std::string resolve_hostname(const std::string& hostname);

/**
 * Resolve a hostname to an IPv6 address. Empty if the host has none.
 */
std::string resolve_hostname_v6(const std::string& hostname);

bool is_valid_ipv4(const std::string& ip_str);
bool is_valid_ipv6(const std::string& ip_str);

// 127.0.0.0/8
bool is_loopback_ipv4(const std::string& ip_str);

/**
 * IPv4 addresses of local interfaces that are up, loopback included.
 */
std::vector<std::string> get_local_interface_addresses_v4();

/**
 * Addresses a peer connection advertises as host candidates: every local
 * IPv4 address, non-loopback first, with 127.0.0.1 always present so two
 * endpoints on one machine can reach each other.
 */
std::vector<std::string> get_host_candidate_addresses();

} // namespace network_utils
} // namespace peerdrop
