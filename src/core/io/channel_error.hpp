/**
 * @file   channel_error.hpp
 * @brief  Error codes, categories and the ChannelError exception used by
 *         the data channel transports.
 *
 * Three categories exist besides std::system_category(): the channel's
 * own conditions, getaddrinfo() results and OpenSSL error-queue codes.
 *
 * @date   2026-10-19
 */

#ifndef FTP_DATA_IO_CHANNEL_ERROR_HPP
#define FTP_DATA_IO_CHANNEL_ERROR_HPP

#include <stdexcept>
#include <string>
#include <system_error>

namespace ftp_data {

/**
 * @enum ChannelErrc
 * @brief Conditions raised by the channels themselves.
 */
enum class ChannelErrc {
    EndOfStream = 1,     ///< Peer closed its sending side
    Closed,              ///< Channel was closed before a connection was accepted
    InvalidPort,         ///< Port outside the TCP range
    NotConnected,        ///< No live connection to operate on
    TlsHandshakeFailed   ///< TLS negotiation did not complete
};

/// Category of ChannelErrc values.
const std::error_category& channel_category() noexcept;

/// Category of getaddrinfo() return codes (EAI_*).
const std::error_category& resolver_category() noexcept;

/// Category of OpenSSL ERR_get_error() codes.
const std::error_category& tls_category() noexcept;

std::error_code make_error_code(ChannelErrc e) noexcept;

/**
 * @brief Builds an error from the calling thread's OpenSSL error queue.
 *
 * Drains the queue and keeps its oldest entry; falls back to
 * ChannelErrc::TlsHandshakeFailed when the queue is empty.
 */
std::error_code lastTlsError() noexcept;

/**
 * @brief Builds an error from the current errno value.
 */
std::error_code lastSystemError() noexcept;

/**
 * @class ChannelError
 * @brief Thrown when a channel cannot be constructed.
 *
 * Covers address resolution, dial, bind/listen and TLS setup failures.
 * The error code keeps the original category.
 */
class ChannelError : public std::system_error {
public:
    ChannelError(std::error_code ec, const std::string& what)
      : std::system_error(ec, what) {}
};

} // namespace ftp_data

namespace std {
template <>
struct is_error_code_enum<ftp_data::ChannelErrc> : true_type {};
} // namespace std

#endif // FTP_DATA_IO_CHANNEL_ERROR_HPP
