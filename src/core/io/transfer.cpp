/**
 * @file   transfer.cpp
 * @brief  Implements copyToStream() and copyFromStream().
 *
 * @date   2026-10-19
 */

#include "transfer.hpp"
#include "channel_error.hpp"

#include <istream>
#include <ostream>
#include <vector>

namespace ftp_data {

namespace {
constexpr std::size_t CHUNK = 32 * 1024;
}

std::error_code copyToStream(IDataChannel& channel,
                             std::ostream& out,
                             std::size_t* total)
{
    std::vector<char> buf(CHUNK);
    std::size_t count = 0;

    for (;;) {
        IoResult r = channel.read(buf.data(), buf.size());
        if (r.bytes > 0) {
            out.write(buf.data(), static_cast<std::streamsize>(r.bytes));
            if (!out) return std::make_error_code(std::errc::io_error);
            count += r.bytes;
        }
        if (total) *total = count;

        if (r.error == ChannelErrc::EndOfStream) break;
        if (r.error) return r.error;
    }

    out.flush();
    if (!out) return std::make_error_code(std::errc::io_error);
    return {};
}

std::error_code copyFromStream(std::istream& in,
                               IDataChannel& channel,
                               std::size_t* total)
{
    std::vector<char> buf(CHUNK);
    std::size_t count = 0;

    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) break;

        IoResult r = channel.write(buf.data(), got);
        count += r.bytes;
        if (total) *total = count;
        if (r.error) return r.error;
    }

    // eof is the normal way out; anything else is a read failure
    if (in.bad() || (in.fail() && !in.eof()))
        return std::make_error_code(std::errc::io_error);
    return {};
}

} // namespace ftp_data
