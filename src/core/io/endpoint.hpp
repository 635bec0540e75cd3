/**
 * @file   endpoint.hpp
 * @brief  Address helpers: host/port joining, TCP resolution and
 *         bound-port lookup.
 *
 * @date   2026-10-19
 */

#ifndef FTP_DATA_IO_ENDPOINT_HPP
#define FTP_DATA_IO_ENDPOINT_HPP

#include <memory>
#include <string>
#include <system_error>
#include <netdb.h>

namespace ftp_data {

/// Releases a getaddrinfo() result list.
struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const noexcept {
        if (ai) ::freeaddrinfo(ai);
    }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

/**
 * @brief Formats "host:port", bracketing IPv6 literals ("[::1]:21").
 */
std::string joinHostPort(const std::string& host, int port);

/**
 * @brief Checks a TCP port number.
 * @param port       Port to check.
 * @param allowZero  Accept 0 ("any port"), valid only for listening.
 */
bool isValidPort(int port, bool allowZero) noexcept;

/**
 * @brief Resolves a TCP endpoint with getaddrinfo().
 *
 * @param host     Hostname or IP literal; empty selects the wildcard
 *                 address when `passive` is true.
 * @param port     Port number.
 * @param passive  True to resolve an address suitable for bind().
 * @param[out] out Resolved address list on success.
 * @return         Empty on success, resolver_category() code otherwise.
 */
std::error_code resolveTcp(const std::string& host,
                           int port,
                           bool passive,
                           AddrInfoPtr& out) noexcept;

/**
 * @brief Reads back the local port a socket is bound to.
 *
 * @param fd       Bound socket.
 * @param[out] ec  Set on failure.
 * @return         The port, or 0 on failure.
 */
int boundPort(int fd, std::error_code& ec) noexcept;

} // namespace ftp_data

#endif // FTP_DATA_IO_ENDPOINT_HPP
