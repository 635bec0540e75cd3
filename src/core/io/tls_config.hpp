/**
 * @file   tls_config.hpp
 * @brief  Declares TlsConfig: a shareable, ready-to-use OpenSSL context.
 *
 * The channels only consume a TlsConfig.  The static helpers build one
 * from PEM material for the command-line tool and the tests.
 *
 * @date   2026-10-19
 */

#ifndef FTP_DATA_IO_TLS_CONFIG_HPP
#define FTP_DATA_IO_TLS_CONFIG_HPP

#include <memory>
#include <string>

#include <openssl/ssl.h>

namespace ftp_data {

/**
 * @class TlsConfig
 * @brief Owns an SSL_CTX shared by every connection created from it.
 */
class TlsConfig {
public:
    /**
     * @brief Adopts an already configured context.
     * @param ctx  Context to own; freed with the TlsConfig.
     */
    explicit TlsConfig(SSL_CTX* ctx) noexcept;
    ~TlsConfig();

    TlsConfig(const TlsConfig&) = delete;
    TlsConfig& operator=(const TlsConfig&) = delete;

    /**
     * @brief Server context from a PEM certificate chain file and key file.
     * @throws ChannelError if a file cannot be loaded or the key does not
     *         match the certificate.
     */
    static std::shared_ptr<const TlsConfig> fromFiles(const std::string& certFile,
                                                      const std::string& keyFile);

    /**
     * @brief Server context from in-memory PEM certificate and key.
     * @throws ChannelError on malformed PEM or mismatching key.
     */
    static std::shared_ptr<const TlsConfig> fromPem(const std::string& certPem,
                                                    const std::string& keyPem);

    /**
     * @brief Client context for dialing TLS data connections.
     * @param verifyPeer  Verify the server against the default trust store.
     * @throws ChannelError if the context cannot be created.
     */
    static std::shared_ptr<const TlsConfig> client(bool verifyPeer = false);

    /// Raw context handle for SSL_new().
    SSL_CTX* native() const noexcept { return m_ctx; }

private:
    SSL_CTX* m_ctx{nullptr};
};

using TlsConfigPtr = std::shared_ptr<const TlsConfig>;

} // namespace ftp_data

#endif // FTP_DATA_IO_TLS_CONFIG_HPP
