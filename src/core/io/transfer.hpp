/**
 * @file   transfer.hpp
 * @brief  Stream copy helpers between std iostreams and data channels.
 *
 * Raw bytes only; no framing or transfer-type conversion.
 *
 * @date   2026-10-19
 */

#ifndef FTP_DATA_IO_TRANSFER_HPP
#define FTP_DATA_IO_TRANSFER_HPP

#include "data_channel.hpp"

#include <cstddef>
#include <iosfwd>
#include <system_error>

namespace ftp_data {

/**
 * @brief Reads `channel` until end of stream and writes the bytes to `out`.
 *
 * @param channel      Source channel.
 * @param out          Destination stream.
 * @param[out] total   Optional byte counter.
 * @return             Empty at a clean end of stream; the channel error,
 *                     or std::errc::io_error if `out` fails.
 */
std::error_code copyToStream(IDataChannel& channel,
                             std::ostream& out,
                             std::size_t* total = nullptr);

/**
 * @brief Writes everything `in` yields into `channel`.
 *
 * @param in           Source stream, read until EOF.
 * @param channel      Destination channel.
 * @param[out] total   Optional byte counter.
 * @return             Empty on success; the channel error, or
 *                     std::errc::io_error if `in` fails before EOF.
 */
std::error_code copyFromStream(std::istream& in,
                               IDataChannel& channel,
                               std::size_t* total = nullptr);

} // namespace ftp_data

#endif // FTP_DATA_IO_TRANSFER_HPP
