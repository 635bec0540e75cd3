/**
 * @file   passive_channel.cpp
 * @brief  Implements PassiveChannel: bind/listen, the background accept
 *         and the readiness gate in front of read() and write().
 *
 * @date   2026-10-19
 */

#include "passive_channel.hpp"
#include "channel_error.hpp"
#include "endpoint.hpp"

#include <cerrno>
#include <system_error>
#include <unistd.h>
#include <sys/socket.h>

namespace ftp_data {

PassiveChannel::PassiveChannel(const std::string& host,
                               int port,
                               SessionLoggerPtr logger,
                               const std::string& sessionId,
                               TlsConfigPtr tls)
  : m_host(host)
  , m_port(port)
  , m_logger(std::move(logger))
  , m_sessionId(sessionId)
  , m_tls(std::move(tls))
  , m_resolved(m_resolvedPromise.get_future().share())
{
    if (!isValidPort(port, /*allowZero=*/true))
        fail(make_error_code(ChannelErrc::InvalidPort),
             "invalid passive port " + std::to_string(port));

    listen(port);

    m_logger->print(m_sessionId, "Listening for passive data connection on "
                                 + joinHostPort(m_host, m_port)
                                 + (m_tls ? " (TLS)" : ""));

    try {
        m_acceptor = std::thread(&PassiveChannel::acceptOnce, this);
    }
    catch (const std::system_error& e) {
        ::close(m_listenFd);
        m_listenFd = -1;
        fail(e.code(), "cannot start passive accept thread");
    }
}

PassiveChannel::~PassiveChannel() {
    (void)close();   // never fails while no connection exists; logged otherwise
    if (m_acceptor.joinable())
        m_acceptor.join();
}

void PassiveChannel::fail(const std::error_code& ec, const std::string& what) {
    m_logger->print(m_sessionId, what + ": " + ec.message());
    throw ChannelError(ec, what);
}

void PassiveChannel::listen(int requestedPort) {
    const std::string target = joinHostPort(m_host, requestedPort);

    // 1) Resolve the local address
    AddrInfoPtr addrs;
    if (auto ec = resolveTcp(m_host, requestedPort, /*passive=*/true, addrs))
        fail(ec, "cannot resolve bind address " + target);

    // 2) Bind & listen on the first address that accepts it
    std::error_code last = std::make_error_code(std::errc::address_not_available);
    for (const addrinfo* ai = addrs.get(); ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last = lastSystemError();
            continue;
        }

        int opt = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0
            || ::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0
            || ::listen(fd, 1) < 0)
        {
            last = lastSystemError();
            ::close(fd);
            continue;
        }

        // 3) Read back the actual port; 0 asked the kernel to pick one
        std::error_code ec;
        int actual = boundPort(fd, ec);
        if (ec) {
            ::close(fd);
            fail(ec, "cannot read bound port of " + target);
        }

        m_listenFd = fd;
        m_port     = actual;
        return;
    }

    fail(last, "cannot listen on " + target);
}

std::error_code PassiveChannel::acceptConnection(SocketStream& conn) noexcept {
    int fd = -1;
    for (;;) {
        fd = ::accept4(m_listenFd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd >= 0) break;
        // a client that gave up between SYN and accept is not our failure
        if (errno == EINTR || errno == ECONNABORTED) continue;
        return lastSystemError();
    }
    conn = SocketStream(fd);

    if (!m_tls) return {};

    {
        std::lock_guard<std::mutex> lk(m_mtx);
        if (m_closed) return make_error_code(ChannelErrc::Closed);
        m_handshakeFd = fd;
    }
    return conn.startTls(*m_tls, TlsRole::Server);
}

void PassiveChannel::acceptOnce() noexcept {
    SocketStream conn;
    std::error_code ec = acceptConnection(conn);
    const bool tls = conn.isTls();

    {
        std::lock_guard<std::mutex> lk(m_mtx);
        if (m_closed) {
            // close() ran first, whatever the accept produced is discarded
            ec = make_error_code(ChannelErrc::Closed);
            conn = SocketStream();
        }

        if (ec) m_err  = ec;
        else    m_conn = std::move(conn);

        m_handshakeFd = -1;
        ::close(m_listenFd);
        m_listenFd = -1;
    }

    if (ec) m_logger->print(m_sessionId, "passive accept", ec);
    else    m_logger->print(m_sessionId, std::string("Passive data connection established")
                                         + (tls ? " (TLS)" : ""));

    m_resolvedPromise.set_value();
}

std::error_code PassiveChannel::waitReady() const noexcept {
    m_resolved.wait();
    return m_err;
}

std::error_code PassiveChannel::beginTransfer() noexcept {
    std::lock_guard<std::mutex> lk(m_mtx);
    if (m_closed) return make_error_code(ChannelErrc::Closed);
    ++m_busy;
    return {};
}

void PassiveChannel::endTransfer(IoResult& r) noexcept {
    std::lock_guard<std::mutex> lk(m_mtx);
    // a transfer cut short by close() reports why
    if (r.error && m_closed) r.error = make_error_code(ChannelErrc::Closed);
    if (--m_busy == 0) m_idle.notify_all();
}

IoResult PassiveChannel::read(void* buf, std::size_t len) noexcept {
    if (auto ec = waitReady()) return {0, ec};
    if (auto ec = beginTransfer()) return {0, ec};

    IoResult r = m_conn.read(buf, len);
    endTransfer(r);
    if (r.error && r.error != ChannelErrc::EndOfStream && r.error != ChannelErrc::Closed)
        m_logger->print(m_sessionId, "passive read", r.error);
    return r;
}

IoResult PassiveChannel::write(const void* buf, std::size_t len) noexcept {
    if (auto ec = waitReady()) return {0, ec};
    if (auto ec = beginTransfer()) return {0, ec};

    IoResult r = m_conn.write(buf, len);
    endTransfer(r);
    if (r.error && r.error != ChannelErrc::Closed)
        m_logger->print(m_sessionId, "passive write", r.error);
    return r;
}

std::error_code PassiveChannel::close() noexcept {
    std::unique_lock<std::mutex> lk(m_mtx);

    if (m_conn.isOpen()) {
        m_closed = true;
        if (m_busy > 0) {
            m_conn.interrupt();
            m_idle.wait(lk, [this]{ return m_busy == 0; });
        }
        std::error_code ec = m_conn.close();
        lk.unlock();

        if (ec) m_logger->print(m_sessionId, "passive close", ec);
        return ec;
    }

    // Nothing accepted yet: wake the accept thread so it resolves as Closed.
    m_closed = true;
    if (m_listenFd >= 0)    (void)::shutdown(m_listenFd, SHUT_RDWR);
    if (m_handshakeFd >= 0) (void)::shutdown(m_handshakeFd, SHUT_RDWR);
    return {};
}

} // namespace ftp_data
