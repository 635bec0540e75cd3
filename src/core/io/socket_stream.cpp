/**
 * @file   socket_stream.cpp
 * @brief  Implements SocketStream: dialing, TLS handshake, blocking
 *         read/write and shutdown for plain and TLS sockets.
 *
 * @date   2026-10-19
 */

#include "socket_stream.hpp"
#include "channel_error.hpp"
#include "tls_config.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <unistd.h>
#include <sys/socket.h>
#include <openssl/err.h>

namespace ftp_data {

namespace {

// SSL_read/SSL_write take an int length.
int clampToInt(std::size_t len) noexcept {
    return static_cast<int>(std::min<std::size_t>(len, INT_MAX));
}

// Maps the SSL_get_error() result of a failed call to an error code.
// Returns an empty code when the call should simply be retried.
std::error_code tlsFailure(SSL* ssl, int rc) noexcept {
    switch (::SSL_get_error(ssl, rc)) {
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
        return {};
    case SSL_ERROR_ZERO_RETURN:
        return make_error_code(ChannelErrc::EndOfStream);
    case SSL_ERROR_SYSCALL:
        if (errno != 0) return lastSystemError();
        return make_error_code(ChannelErrc::EndOfStream);
    default:
        return lastTlsError();
    }
}

} // namespace

SocketStream::SocketStream(int fd) noexcept
  : m_fd(fd)
{
}

SocketStream::~SocketStream() {
    release();
}

SocketStream::SocketStream(SocketStream&& other) noexcept
  : m_fd(other.m_fd)
  , m_ssl(other.m_ssl)
{
    other.m_fd  = -1;
    other.m_ssl = nullptr;
}

SocketStream& SocketStream::operator=(SocketStream&& other) noexcept {
    if (this != &other) {
        release();
        m_fd  = other.m_fd;
        m_ssl = other.m_ssl;
        other.m_fd  = -1;
        other.m_ssl = nullptr;
    }
    return *this;
}

std::error_code SocketStream::dial(const addrinfo* list, SocketStream& out) noexcept {
    std::error_code last = std::make_error_code(std::errc::host_unreachable);

    for (const addrinfo* ai = list; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last = lastSystemError();
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            out = SocketStream(fd);
            return {};
        }
        last = lastSystemError();
        ::close(fd);
    }
    return last;
}

std::error_code SocketStream::startTls(const TlsConfig& tls, TlsRole role) noexcept {
    if (m_fd < 0) return make_error_code(ChannelErrc::NotConnected);

    ::ERR_clear_error();
    SSL* ssl = ::SSL_new(tls.native());
    if (!ssl) return lastTlsError();

    if (::SSL_set_fd(ssl, m_fd) != 1) {
        ::SSL_free(ssl);
        return lastTlsError();
    }
    // contexts built elsewhere may lack it
    ::SSL_set_options(ssl, SSL_OP_IGNORE_UNEXPECTED_EOF);

    for (;;) {
        errno = 0;
        int rc = (role == TlsRole::Server) ? ::SSL_accept(ssl) : ::SSL_connect(ssl);
        if (rc == 1) break;

        std::error_code ec = tlsFailure(ssl, rc);
        if (!ec) continue;
        if (ec == ChannelErrc::EndOfStream)
            ec = make_error_code(ChannelErrc::TlsHandshakeFailed);
        ::SSL_free(ssl);
        return ec;
    }

    m_ssl = ssl;
    return {};
}

IoResult SocketStream::read(void* buf, std::size_t len) noexcept {
    if (m_fd < 0) return {0, make_error_code(ChannelErrc::NotConnected)};
    if (len == 0) return {};

    if (m_ssl) {
        for (;;) {
            ::ERR_clear_error();
            errno = 0;
            int n = ::SSL_read(m_ssl, buf, clampToInt(len));
            if (n > 0) return {static_cast<std::size_t>(n), {}};
            std::error_code ec = tlsFailure(m_ssl, n);
            if (ec) return {0, ec};
        }
    }

    for (;;) {
        ssize_t n = ::recv(m_fd, buf, len, 0);
        if (n > 0) return {static_cast<std::size_t>(n), {}};
        if (n == 0) return {0, make_error_code(ChannelErrc::EndOfStream)};
        if (errno != EINTR) return {0, lastSystemError()};
    }
}

IoResult SocketStream::write(const void* buf, std::size_t len) noexcept {
    if (m_fd < 0) return {0, make_error_code(ChannelErrc::NotConnected)};

    const char* p = static_cast<const char*>(buf);
    std::size_t done = 0;

    while (done < len) {
        if (m_ssl) {
            ::ERR_clear_error();
            errno = 0;
            int n = ::SSL_write(m_ssl, p + done, clampToInt(len - done));
            if (n > 0) {
                done += static_cast<std::size_t>(n);
                continue;
            }
            std::error_code ec = tlsFailure(m_ssl, n);
            if (ec) return {done, ec};
        } else {
            ssize_t n = ::send(m_fd, p + done, len - done, MSG_NOSIGNAL);
            if (n >= 0) {
                done += static_cast<std::size_t>(n);
                continue;
            }
            if (errno != EINTR) return {done, lastSystemError()};
        }
    }
    return {done, {}};
}

std::error_code SocketStream::close() noexcept {
    if (m_fd < 0) return make_error_code(ChannelErrc::NotConnected);

    if (m_ssl) {
        // close_notify is best effort: the peer may already be gone, and
        // that is not a failure of our side of the close
        ::ERR_clear_error();
        if (::SSL_shutdown(m_ssl) < 0)
            ::ERR_clear_error();
        ::SSL_free(m_ssl);
        m_ssl = nullptr;
    }

    interrupt();

    std::error_code ec;
    if (::close(m_fd) < 0) ec = lastSystemError();
    m_fd = -1;
    return ec;
}

void SocketStream::interrupt() const noexcept {
    if (m_fd >= 0) {
        // ENOTCONN after a peer reset is expected here
        (void)::shutdown(m_fd, SHUT_RDWR);
    }
}

void SocketStream::release() noexcept {
    // destructor and move-assignment path, nobody to report the error to
    if (m_fd >= 0) (void)close();
}

} // namespace ftp_data
