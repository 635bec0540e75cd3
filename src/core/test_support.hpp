// test_support.hpp
// Shared helpers for the standalone test programs: a check counter, a
// recording session logger, a raw loopback listener and an in-memory
// self-signed certificate.
#ifndef FTP_DATA_TEST_SUPPORT_HPP
#define FTP_DATA_TEST_SUPPORT_HPP

#include <algorithm>
#include <chrono>
#include <cstring>
#include <future>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <arpa/inet.h>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include "session_logger.hpp"
#include "io/channel_error.hpp"
#include "io/endpoint.hpp"
#include "io/socket_stream.hpp"
#include "io/transfer.hpp"

namespace test_support {

inline int g_failures = 0;

inline void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  ok   " << what << "\n";
    } else {
        std::cout << "  FAIL " << what << "\n";
        ++g_failures;
    }
}

inline int summary(const char* suite) {
    if (g_failures == 0) std::cout << suite << ": all checks passed\n";
    else                 std::cout << suite << ": " << g_failures << " check(s) failed\n";
    return g_failures == 0 ? 0 : 1;
}

/// Session logger keeping every line for later inspection.
class RecordingLogger final : public ftp_data::ISessionLogger {
public:
    using ftp_data::ISessionLogger::print;

    void print(const std::string& sessionId, const std::string& message) noexcept override {
        std::lock_guard<std::mutex> lk(m_mtx);
        m_lines.push_back(sessionId + " " + message);
    }

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lk(m_mtx);
        return std::any_of(m_lines.begin(), m_lines.end(),
                           [&](const std::string& l){ return l.find(needle) != std::string::npos; });
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_mtx);
        return m_lines.size();
    }

private:
    mutable std::mutex       m_mtx;
    std::vector<std::string> m_lines;
};

/// Plain loopback listener on an ephemeral port, independent of the
/// channel classes under test.
class LoopbackListener {
public:
    LoopbackListener() {
        m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;
        if (m_fd < 0
            || ::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0
            || ::listen(m_fd, 4) < 0)
        {
            std::cerr << "LoopbackListener: cannot listen\n";
            return;
        }
        std::error_code ec;
        m_port = ftp_data::boundPort(m_fd, ec);
    }

    ~LoopbackListener() { if (m_fd >= 0) ::close(m_fd); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    int port() const { return m_port; }

    /// Blocks for one client.
    ftp_data::SocketStream accept() {
        int fd = ::accept(m_fd, nullptr, nullptr);
        return ftp_data::SocketStream(fd);
    }

    /// Stops listening; later dials to port() are refused.
    void shutdown() {
        if (m_fd >= 0) ::close(m_fd);
        m_fd = -1;
    }

private:
    int m_fd{-1};
    int m_port{0};
};

/// Connects a plain client to 127.0.0.1:port.
inline ftp_data::SocketStream dialLoopback(int port) {
    ftp_data::AddrInfoPtr addrs;
    ftp_data::SocketStream s;
    if (ftp_data::resolveTcp("127.0.0.1", port, false, addrs)
        || ftp_data::SocketStream::dial(addrs.get(), s))
    {
        std::cerr << "dialLoopback: cannot connect to port " << port << "\n";
    }
    return s;
}

/// Reads exactly `n` bytes unless the stream ends or fails first.
inline std::string readExactly(ftp_data::SocketStream& s, std::size_t n) {
    std::string out;
    char buf[4096];
    while (out.size() < n) {
        ftp_data::IoResult r = s.read(buf, std::min(sizeof(buf), n - out.size()));
        out.append(buf, r.bytes);
        if (r.error) break;
    }
    return out;
}

/// Drains a channel until end of stream.
inline std::string readAll(ftp_data::IDataChannel& channel, std::error_code& ec) {
    std::ostringstream out;
    ec = ftp_data::copyToStream(channel, out);
    return out.str();
}

/// Blocks a reader on `channel`, then closes the channel from this thread.
/// Returns false when the reader did not block or did not come back within
/// five seconds of the close.
inline bool closeWhileReading(ftp_data::IDataChannel& channel,
                              std::error_code& readErr,
                              std::error_code& closeErr)
{
    auto reader = std::async(std::launch::async, [&]{
        char buf[256];
        return channel.read(buf, sizeof(buf)).error;
    });
    if (reader.wait_for(std::chrono::milliseconds(200)) != std::future_status::timeout) {
        readErr = reader.get();
        return false;
    }

    closeErr = channel.close();
    if (reader.wait_for(std::chrono::seconds(5)) != std::future_status::ready)
        return false;
    readErr = reader.get();
    return true;
}

/// Deterministic, non-repeating-looking payload of `n` bytes.
inline std::string makePayload(std::size_t n) {
    std::string s(n, '\0');
    unsigned x = 2463534242u;
    for (auto& c : s) {
        x ^= x << 13; x ^= x >> 17; x ^= x << 5;
        c = static_cast<char>(x & 0xff);
    }
    return s;
}

/// Self-signed P-256 certificate for "localhost", PEM encoded.
inline bool makeSelfSignedPem(std::string& certPem, std::string& keyPem) {
    EVP_PKEY* key = EVP_EC_gen("P-256");
    X509* cert = X509_new();
    bool ok = key && cert;

    if (ok) {
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_set_version(cert, 2);
        X509_gmtime_adj(X509_getm_notBefore(cert), -60);
        X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
        X509_set_pubkey(cert, key);

        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("localhost"),
                                   -1, -1, 0);
        X509_set_issuer_name(cert, name);
        ok = X509_sign(cert, key, EVP_sha256()) > 0;
    }

    auto toString = [](BIO* bio) {
        char* data = nullptr;
        long len = BIO_get_mem_data(bio, &data);
        return std::string(data, static_cast<std::size_t>(len));
    };

    if (ok) {
        BIO* cb = BIO_new(BIO_s_mem());
        BIO* kb = BIO_new(BIO_s_mem());
        ok = cb && kb
          && PEM_write_bio_X509(cb, cert) == 1
          && PEM_write_bio_PrivateKey(kb, key, nullptr, nullptr, 0, nullptr, nullptr) == 1;
        if (ok) {
            certPem = toString(cb);
            keyPem  = toString(kb);
        }
        BIO_free(cb);
        BIO_free(kb);
    }

    X509_free(cert);
    EVP_PKEY_free(key);
    return ok;
}

} // namespace test_support

#endif // FTP_DATA_TEST_SUPPORT_HPP
