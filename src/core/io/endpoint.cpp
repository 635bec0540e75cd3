/**
 * @file   endpoint.cpp
 * @brief  Implements address joining, resolution and bound-port lookup.
 *
 * @date   2026-10-19
 */

#include "endpoint.hpp"
#include "channel_error.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace ftp_data {

std::string joinHostPort(const std::string& host, int port) {
    if (host.find(':') != std::string::npos)
        return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

bool isValidPort(int port, bool allowZero) noexcept {
    return port <= 65535 && (port > 0 || (allowZero && port == 0));
}

std::error_code resolveTcp(const std::string& host,
                           int port,
                           bool passive,
                           AddrInfoPtr& out) noexcept
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    if (passive) hints.ai_flags |= AI_PASSIVE;

    const std::string service = std::to_string(port);
    const char* node = host.empty() ? nullptr : host.c_str();

    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(node, service.c_str(), &hints, &res);
    if (rc == EAI_SYSTEM)
        return lastSystemError();
    if (rc != 0)
        return {rc, resolver_category()};

    out.reset(res);
    return {};
}

int boundPort(int fd, std::error_code& ec) noexcept {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) < 0) {
        ec = lastSystemError();
        return 0;
    }

    switch (ss.ss_family) {
    case AF_INET:
        return ntohs(reinterpret_cast<const sockaddr_in*>(&ss)->sin_port);
    case AF_INET6:
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&ss)->sin6_port);
    default:
        ec = std::make_error_code(std::errc::address_family_not_supported);
        return 0;
    }
}

} // namespace ftp_data
