/**
 * @file   channel_error.cpp
 * @brief  Implements the error categories declared in channel_error.hpp.
 *
 * @date   2026-10-19
 */

#include "channel_error.hpp"

#include <cerrno>
#include <netdb.h>
#include <openssl/err.h>

namespace ftp_data {

namespace {

class ChannelCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "ftp_data.channel"; }

    std::string message(int ev) const override {
        switch (static_cast<ChannelErrc>(ev)) {
        case ChannelErrc::EndOfStream:        return "end of stream";
        case ChannelErrc::Closed:             return "data channel closed before a connection was accepted";
        case ChannelErrc::InvalidPort:        return "port outside the valid TCP range";
        case ChannelErrc::NotConnected:       return "data channel has no live connection";
        case ChannelErrc::TlsHandshakeFailed: return "TLS handshake failed";
        }
        return "unknown data channel error";
    }
};

class ResolverCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "ftp_data.resolver"; }

    std::string message(int ev) const override {
        return ::gai_strerror(ev);
    }
};

class TlsCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "ftp_data.tls"; }

    std::string message(int ev) const override {
        char buf[256];
        // codes are packed into 32 bits, see ERR_PACK
        ::ERR_error_string_n(static_cast<unsigned int>(ev), buf, sizeof(buf));
        return buf;
    }
};

} // namespace

const std::error_category& channel_category() noexcept {
    static const ChannelCategory cat;
    return cat;
}

const std::error_category& resolver_category() noexcept {
    static const ResolverCategory cat;
    return cat;
}

const std::error_category& tls_category() noexcept {
    static const TlsCategory cat;
    return cat;
}

std::error_code make_error_code(ChannelErrc e) noexcept {
    return {static_cast<int>(e), channel_category()};
}

std::error_code lastTlsError() noexcept {
    unsigned long first = ::ERR_get_error();
    // drop the rest so it does not leak into the next call on this thread
    ::ERR_clear_error();
    if (first == 0)
        return make_error_code(ChannelErrc::TlsHandshakeFailed);
    return {static_cast<int>(first), tls_category()};
}

std::error_code lastSystemError() noexcept {
    return {errno, std::system_category()};
}

} // namespace ftp_data
