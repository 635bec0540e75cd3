/**
 * @file   active_channel.hpp
 * @brief  Declares ActiveChannel: the active-mode (server dials out)
 *         IDataChannel transport.
 *
 * @date   2026-10-19
 */

#ifndef FTP_DATA_IO_ACTIVE_CHANNEL_HPP
#define FTP_DATA_IO_ACTIVE_CHANNEL_HPP

#include "data_channel.hpp"
#include "socket_stream.hpp"
#include "tls_config.hpp"
#include "../session_logger.hpp"

#include <condition_variable>
#include <mutex>
#include <string>

namespace ftp_data {

/**
 * @class ActiveChannel
 * @brief Data connection the server opens to a client-given address.
 *
 * The constructor resolves and dials synchronously; once it returns the
 * channel is connected.  No retry is attempted.
 */
class ActiveChannel final : public IDataChannel {
public:
    /**
     * @brief Resolves `host` and connects to it.
     *
     * @param host       Remote hostname or IP literal.
     * @param port       Remote port, 1..65535.
     * @param logger     Diagnostics sink; must not be null.
     * @param sessionId  Tag for every diagnostic line.
     * @param tls        Optional; when set the server side of a TLS
     *                   handshake runs on the dialed connection.
     * @throws ChannelError on invalid port, resolution, dial or handshake
     *         failure.
     */
    ActiveChannel(const std::string& host,
                  int port,
                  SessionLoggerPtr logger,
                  const std::string& sessionId,
                  TlsConfigPtr tls = nullptr);

    const std::string& host() const noexcept override { return m_host; }
    int port() const noexcept override { return m_port; }

    IoResult read(void* buf, std::size_t len) noexcept override;
    IoResult write(const void* buf, std::size_t len) noexcept override;

    /**
     * @brief Closes the connection.
     *
     * May run while another thread is blocked in read() or write(): the
     * socket is shut down first, the call waits for those transfers to
     * return (they report ChannelErrc::Closed), then the connection is
     * released.
     */
    std::error_code close() noexcept override;

private:
    [[noreturn]] void fail(const std::error_code& ec, const std::string& what);
    std::error_code beginTransfer() noexcept;
    void endTransfer(IoResult& r) noexcept;

    std::string      m_host;
    int              m_port;
    SessionLoggerPtr m_logger;
    std::string      m_sessionId;
    SocketStream     m_conn;

    std::mutex              m_mtx;        ///< Guards the fields below
    std::condition_variable m_idle;       ///< Signalled when m_busy drops to 0
    int                     m_busy{0};    ///< read()/write() calls inside m_conn
    bool                    m_closed{false};
};

} // namespace ftp_data

#endif // FTP_DATA_IO_ACTIVE_CHANNEL_HPP
