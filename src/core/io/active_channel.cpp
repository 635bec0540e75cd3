/**
 * @file   active_channel.cpp
 * @brief  Implements ActiveChannel: resolve, dial and delegate I/O.
 *
 * @date   2026-10-19
 */

#include "active_channel.hpp"
#include "channel_error.hpp"
#include "endpoint.hpp"

namespace ftp_data {

ActiveChannel::ActiveChannel(const std::string& host,
                             int port,
                             SessionLoggerPtr logger,
                             const std::string& sessionId,
                             TlsConfigPtr tls)
  : m_host(host)
  , m_port(port)
  , m_logger(std::move(logger))
  , m_sessionId(sessionId)
{
    const std::string target = joinHostPort(m_host, m_port);
    m_logger->print(m_sessionId, "Opening active data connection to " + target);

    if (!isValidPort(m_port, /*allowZero=*/false))
        fail(make_error_code(ChannelErrc::InvalidPort), "invalid port for " + target);

    // 1) Resolve
    AddrInfoPtr addrs;
    if (auto ec = resolveTcp(m_host, m_port, /*passive=*/false, addrs))
        fail(ec, "cannot resolve " + target);

    // 2) Dial
    if (auto ec = SocketStream::dial(addrs.get(), m_conn))
        fail(ec, "cannot connect to " + target);

    // 3) Optional TLS, server side as for any FTPS data connection
    if (tls) {
        if (auto ec = m_conn.startTls(*tls, TlsRole::Server))
            fail(ec, "TLS handshake with " + target + " failed");
    }
}

void ActiveChannel::fail(const std::error_code& ec, const std::string& what) {
    m_logger->print(m_sessionId, what + ": " + ec.message());
    throw ChannelError(ec, what);
}

std::error_code ActiveChannel::beginTransfer() noexcept {
    std::lock_guard<std::mutex> lk(m_mtx);
    if (m_closed) return make_error_code(ChannelErrc::Closed);
    ++m_busy;
    return {};
}

void ActiveChannel::endTransfer(IoResult& r) noexcept {
    std::lock_guard<std::mutex> lk(m_mtx);
    // a transfer cut short by close() reports why
    if (r.error && m_closed) r.error = make_error_code(ChannelErrc::Closed);
    if (--m_busy == 0) m_idle.notify_all();
}

IoResult ActiveChannel::read(void* buf, std::size_t len) noexcept {
    if (auto ec = beginTransfer()) return {0, ec};

    IoResult r = m_conn.read(buf, len);
    endTransfer(r);
    if (r.error && r.error != ChannelErrc::EndOfStream && r.error != ChannelErrc::Closed)
        m_logger->print(m_sessionId, "active read", r.error);
    return r;
}

IoResult ActiveChannel::write(const void* buf, std::size_t len) noexcept {
    if (auto ec = beginTransfer()) return {0, ec};

    IoResult r = m_conn.write(buf, len);
    endTransfer(r);
    if (r.error && r.error != ChannelErrc::Closed)
        m_logger->print(m_sessionId, "active write", r.error);
    return r;
}

std::error_code ActiveChannel::close() noexcept {
    std::unique_lock<std::mutex> lk(m_mtx);
    m_closed = true;

    // 1) Wake transfers still inside the stream and let them leave
    if (m_busy > 0) {
        m_conn.interrupt();
        m_idle.wait(lk, [this]{ return m_busy == 0; });
    }

    // 2) Nobody uses the stream any more
    std::error_code ec = m_conn.close();
    lk.unlock();

    if (ec)
        m_logger->print(m_sessionId, "active close", ec);
    return ec;
}

} // namespace ftp_data
