/**
 * @file   passive_channel.hpp
 * @brief  Declares PassiveChannel: the passive-mode (client dials in)
 *         IDataChannel transport.
 *
 * The constructor binds and listens, then hands the single accept to a
 * background thread.  read() and write() wait until that accept has
 * either produced a connection or failed.
 *
 * @date   2026-10-19
 */

#ifndef FTP_DATA_IO_PASSIVE_CHANNEL_HPP
#define FTP_DATA_IO_PASSIVE_CHANNEL_HPP

#include "data_channel.hpp"
#include "socket_stream.hpp"
#include "tls_config.hpp"
#include "../session_logger.hpp"

#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace ftp_data {

/**
 * @class PassiveChannel
 * @brief Listens on a (possibly ephemeral) port and accepts one client.
 *
 * State moves from pending to either ready (connection recorded) or
 * failed (error recorded) exactly once.  Neither outcome is ever
 * replaced.  Every caller waiting in read()/write() observes the same
 * outcome.
 */
class PassiveChannel final : public IDataChannel {
public:
    /**
     * @brief Binds a listener and starts accepting in the background.
     *
     * Returns as soon as the socket is listening and its port is known.
     *
     * @param host       Bind host; empty binds every local interface.
     * @param port       Requested port, 0 for an ephemeral one.
     * @param logger     Diagnostics sink; must not be null.
     * @param sessionId  Tag for every diagnostic line.
     * @param tls        Optional; accepted connections are TLS negotiated
     *                   (server side) before they become usable.
     * @throws ChannelError on invalid port, resolution, bind or listen
     *         failure.  No background thread exists in that case.
     */
    PassiveChannel(const std::string& host,
                   int port,
                   SessionLoggerPtr logger,
                   const std::string& sessionId,
                   TlsConfigPtr tls = nullptr);

    /**
     * @brief Closes everything and joins the accept thread.
     */
    ~PassiveChannel() override;

    PassiveChannel(const PassiveChannel&) = delete;
    PassiveChannel& operator=(const PassiveChannel&) = delete;

    const std::string& host() const noexcept override { return m_host; }

    /// Actual bound port, never 0 after construction.
    int port() const noexcept override { return m_port; }

    /// Blocks until the accept resolves, then reads or fails.
    IoResult read(void* buf, std::size_t len) noexcept override;

    /// Blocks until the accept resolves, then writes or fails.
    IoResult write(const void* buf, std::size_t len) noexcept override;

    /**
     * @brief Closes the accepted connection.
     *
     * Transfers blocked in read() or write() are woken first and report
     * ChannelErrc::Closed; the connection is released once they returned.
     * With no connection yet this succeeds and additionally shuts the
     * listener down, so the pending accept resolves with
     * ChannelErrc::Closed instead of waiting for a client forever.
     */
    std::error_code close() noexcept override;

    /**
     * @brief Waits for the accept outcome without transferring data.
     * @return Empty once a connection is available, the recorded error
     *         otherwise.
     */
    std::error_code waitReady() const noexcept;

private:
    void listen(int requestedPort);
    void acceptOnce() noexcept;
    std::error_code acceptConnection(SocketStream& conn) noexcept;
    std::error_code beginTransfer() noexcept;
    void endTransfer(IoResult& r) noexcept;
    [[noreturn]] void fail(const std::error_code& ec, const std::string& what);

    std::string      m_host;
    int              m_port{0};
    SessionLoggerPtr m_logger;
    std::string      m_sessionId;
    TlsConfigPtr     m_tls;

    std::mutex       m_mtx;              ///< Guards the fields below and the hand-off
    int              m_listenFd{-1};     ///< Owned by the accept thread once started
    int              m_handshakeFd{-1};  ///< Accepted socket while TLS negotiates
    bool             m_closed{false};
    int              m_busy{0};          ///< read()/write() calls inside m_conn
    std::condition_variable m_idle;      ///< Signalled when m_busy drops to 0

    // Written once by the accept thread before m_resolved is set; m_conn is
    // released by close() only while m_busy is 0.
    SocketStream     m_conn;
    std::error_code  m_err;

    std::promise<void>       m_resolvedPromise;
    std::shared_future<void> m_resolved;  ///< One-shot readiness gate
    std::thread              m_acceptor;
};

} // namespace ftp_data

#endif // FTP_DATA_IO_PASSIVE_CHANNEL_HPP
