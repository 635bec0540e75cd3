/**
 * @file   data_channel.hpp
 * @brief  Defines the abstract IDataChannel interface and the IoResult
 *         struct shared by the active and passive data transports.
 *
 * @date   2026-10-19
 */

#ifndef FTP_DATA_IO_DATA_CHANNEL_HPP
#define FTP_DATA_IO_DATA_CHANNEL_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <system_error>

namespace ftp_data {

/**
 * @struct IoResult
 * @brief Outcome of a single read or write on a data channel.
 *
 * `bytes` is the number of bytes transferred; `error` is empty on
 * success.  End of stream is reported as ChannelErrc::EndOfStream.
 */
struct IoResult {
    std::size_t     bytes = 0;  ///< Bytes transferred by this call
    std::error_code error;      ///< Empty on success

    /// True when the call did not fail.
    explicit operator bool() const noexcept { return !error; }
};

/**
 * @class IDataChannel
 * @brief Uniform byte-stream endpoint for FTP data connections.
 *
 * Both connection modes (active dial-out, passive listen) implement this
 * contract; everything above the transport depends on it only.
 */
class IDataChannel {
public:
    /**
     * @brief Virtual destructor; releases whatever connection is owned.
     */
    virtual ~IDataChannel() = default;

    /**
     * @brief Host the channel was created for.
     *
     * Active: the dialed peer.  Passive: the bind host.
     */
    virtual const std::string& host() const noexcept = 0;

    /**
     * @brief Port of the channel.
     *
     * Passive channels report the port actually bound, so a request for
     * port 0 yields the OS-assigned ephemeral port.
     */
    virtual int port() const noexcept = 0;

    /**
     * @brief Reads up to `len` bytes into `buf`.
     *
     * @param buf  Destination buffer.
     * @param len  Capacity of the buffer.
     * @return     Bytes read and the error, if any.
     */
    virtual IoResult read(void* buf, std::size_t len) noexcept = 0;

    /**
     * @brief Writes up to `len` bytes from `buf`.
     *
     * @param buf  Source buffer.
     * @param len  Number of bytes to write.
     * @return     Bytes written and the error, if any.
     */
    virtual IoResult write(const void* buf, std::size_t len) noexcept = 0;

    /**
     * @brief Closes the connection owned by the channel.
     * @return Error from the underlying close, empty otherwise.
     */
    virtual std::error_code close() noexcept = 0;
};

/**
 * @typedef DataChannelPtr
 * @brief Owning pointer alias; a channel belongs to exactly one session.
 */
using DataChannelPtr = std::unique_ptr<IDataChannel>;

} // namespace ftp_data

#endif // FTP_DATA_IO_DATA_CHANNEL_HPP
