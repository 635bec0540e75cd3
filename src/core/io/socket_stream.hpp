/**
 * @file   socket_stream.hpp
 * @brief  Declares SocketStream: an owned, connected TCP socket with an
 *         optional TLS session layered on top.
 *
 * @date   2026-10-19
 */

#ifndef FTP_DATA_IO_SOCKET_STREAM_HPP
#define FTP_DATA_IO_SOCKET_STREAM_HPP

#include "data_channel.hpp"

#include <cstddef>
#include <system_error>
#include <netdb.h>
#include <openssl/ssl.h>

namespace ftp_data {

class TlsConfig;

/// Which side of the TLS handshake a stream plays.
enum class TlsRole { Server, Client };

/**
 * @class SocketStream
 * @brief Move-only owner of a connected socket (and its SSL session).
 *
 * Reads and writes block.  A TLS stream must not be read and written
 * from two threads at the same time; plain streams may.
 */
class SocketStream {
public:
    SocketStream() = default;

    /**
     * @brief Adopts a connected socket descriptor.
     */
    explicit SocketStream(int fd) noexcept;

    ~SocketStream();

    SocketStream(SocketStream&& other) noexcept;
    SocketStream& operator=(SocketStream&& other) noexcept;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    /**
     * @brief Connects to the first reachable address of a resolved list.
     *
     * @param list     getaddrinfo() result.
     * @param[out] out Connected stream on success.
     * @return         Error of the last failed attempt, empty on success.
     */
    static std::error_code dial(const addrinfo* list, SocketStream& out) noexcept;

    /**
     * @brief Runs the TLS handshake over the connected socket.
     *
     * @param tls   Context to create the session from.
     * @param role  Server or client side of the handshake.
     * @return      Empty once the session is established.
     */
    std::error_code startTls(const TlsConfig& tls, TlsRole role) noexcept;

    /// Reads up to `len` bytes; 0 bytes with EndOfStream at end of stream.
    IoResult read(void* buf, std::size_t len) noexcept;

    /// Writes all `len` bytes unless an error interrupts.
    IoResult write(const void* buf, std::size_t len) noexcept;

    /**
     * @brief Sends close_notify (TLS), shuts the socket down and closes it.
     *
     * Frees the SSL session and the descriptor, so no other thread may be
     * inside read(), write() or startTls() on this stream.  Use interrupt()
     * to wake such a thread first.
     *
     * @return First error met; closing a closed stream reports NotConnected.
     */
    std::error_code close() noexcept;

    /**
     * @brief Shuts the socket down in both directions without closing it.
     *
     * Safe to call from another thread to wake a blocked read, write or
     * handshake on this stream.  The descriptor stays allocated until
     * close().
     */
    void interrupt() const noexcept;

    bool isOpen() const noexcept { return m_fd >= 0; }
    bool isTls()  const noexcept { return m_ssl != nullptr; }
    int  fd()     const noexcept { return m_fd; }

private:
    void release() noexcept;

    int  m_fd{-1};          /**< Socket FD or -1 when closed */
    SSL* m_ssl{nullptr};    /**< TLS session, null for plaintext */
};

} // namespace ftp_data

#endif // FTP_DATA_IO_SOCKET_STREAM_HPP
