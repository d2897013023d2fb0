#ifdef _WIN32
    // Include winsock2.h first to avoid conflicts with windows.h
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <netdb.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <ifaddrs.h>
    #include <net/if.h>
#endif

#include "network_utils.h"
#include "logger.h"
#include <cstring>
#include <algorithm>
#include <cerrno>

// Network utilities module logging macros
#define LOG_NETUTILS_DEBUG(message) LOG_DEBUG("network_utils", message)
#define LOG_NETUTILS_ERROR(message) LOG_ERROR("network_utils", message)

namespace peerdrop {
namespace network_utils {

namespace {

// First address of the given family, empty if there is none
std::string resolve(const std::string& hostname, int family) {
    struct addrinfo hints;
    struct addrinfo* result = nullptr;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = family;
    hints.ai_socktype = SOCK_STREAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0 || result == nullptr) {
#ifdef _WIN32
        LOG_NETUTILS_DEBUG("getaddrinfo(" << hostname << ") failed: " << WSAGetLastError());
#else
        LOG_NETUTILS_DEBUG("getaddrinfo(" << hostname << ") failed: " << gai_strerror(status));
#endif
        return "";
    }

    char ip_str[INET6_ADDRSTRLEN] = {0};
    if (family == AF_INET) {
        inet_ntop(AF_INET, &reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr, ip_str, sizeof(ip_str));
    } else {
        inet_ntop(AF_INET6, &reinterpret_cast<struct sockaddr_in6*>(result->ai_addr)->sin6_addr, ip_str, sizeof(ip_str));
    }
    freeaddrinfo(result);
    return std::string(ip_str);
}

} // namespace

std::string resolve_hostname(const std::string& hostname) {
    if (hostname.empty()) {
        return "";
    }
    if (is_valid_ipv4(hostname)) {
        return hostname;
    }

    std::string ip = resolve(hostname, AF_INET);
    if (ip.empty()) {
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname);
    } else {
        LOG_NETUTILS_DEBUG("Resolved " << hostname << " to " << ip);
    }
    return ip;
}

std::string resolve_hostname_v6(const std::string& hostname) {
    if (hostname.empty()) {
        return "";
    }
    if (is_valid_ipv6(hostname)) {
        return hostname;
    }

    // IPv4-only hosts are common, the caller falls back
    std::string ip = resolve(hostname, AF_INET6);
    if (!ip.empty()) {
        LOG_NETUTILS_DEBUG("Resolved " << hostname << " to IPv6 " << ip);
    }
    return ip;
}

bool is_valid_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    return inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) == 1;
}

bool is_valid_ipv6(const std::string& ip_str) {
    struct sockaddr_in6 sa;
    return inet_pton(AF_INET6, ip_str.c_str(), &sa.sin6_addr) == 1;
}

bool is_loopback_ipv4(const std::string& ip_str) {
    return is_valid_ipv4(ip_str) && ip_str.compare(0, 4, "127.") == 0;
}

std::vector<std::string> get_local_interface_addresses_v4() {
    std::vector<std::string> addresses;

#ifdef _WIN32
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        struct addrinfo hints, *result, *rp;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        if (getaddrinfo(hostname, nullptr, &hints, &result) == 0) {
            for (rp = result; rp != nullptr; rp = rp->ai_next) {
                char ip_str[INET_ADDRSTRLEN];
                inet_ntop(AF_INET, &((struct sockaddr_in*)rp->ai_addr)->sin_addr, ip_str, INET_ADDRSTRLEN);
                addresses.push_back(ip_str);
            }
            freeaddrinfo(result);
        }
    }
#else
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        LOG_NETUTILS_ERROR("getifaddrs failed: " << strerror(errno));
        return addresses;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP)) {
            continue;
        }

        char ip_str[INET_ADDRSTRLEN];
        struct sockaddr_in* addr_in = (struct sockaddr_in*)ifa->ifa_addr;
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);

        std::string ip_address(ip_str);
        if (std::find(addresses.begin(), addresses.end(), ip_address) == addresses.end()) {
            addresses.push_back(ip_address);
            LOG_NETUTILS_DEBUG("Found local IPv4 address " << ip_address << " on " << ifa->ifa_name);
        }
    }

    freeifaddrs(ifaddr);
#endif

    return addresses;
}

std::vector<std::string> get_host_candidate_addresses() {
    std::vector<std::string> local = get_local_interface_addresses_v4();

    std::vector<std::string> addresses;
    for (const auto& ip : local) {
        if (!is_loopback_ipv4(ip)) {
            addresses.push_back(ip);
        }
    }
    for (const auto& ip : local) {
        if (is_loopback_ipv4(ip)) {
            addresses.push_back(ip);
        }
    }
    if (std::find(addresses.begin(), addresses.end(), "127.0.0.1") == addresses.end()) {
        addresses.push_back("127.0.0.1");
    }
    return addresses;
}

} // namespace network_utils
} // namespace peerdrop
