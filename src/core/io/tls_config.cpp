/**
 * @file   tls_config.cpp
 * @brief  Implements TlsConfig context construction from PEM material.
 *
 * @date   2026-10-19
 */

#include "tls_config.hpp"
#include "channel_error.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace ftp_data {

namespace {

struct BioDeleter  { void operator()(BIO* b)      const noexcept { ::BIO_free(b); } };
struct X509Deleter { void operator()(X509* x)     const noexcept { ::X509_free(x); } };
struct PkeyDeleter { void operator()(EVP_PKEY* k) const noexcept { ::EVP_PKEY_free(k); } };
struct CtxDeleter  { void operator()(SSL_CTX* c)  const noexcept { ::SSL_CTX_free(c); } };

using BioPtr  = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using CtxPtr  = std::unique_ptr<SSL_CTX, CtxDeleter>;

[[noreturn]] void throwTls(const std::string& what) {
    throw ChannelError(lastTlsError(), what);
}

// Baseline shared by server and client contexts.
CtxPtr newContext(const SSL_METHOD* method) {
    CtxPtr ctx(::SSL_CTX_new(method));
    if (!ctx) throwTls("cannot create TLS context");

    if (::SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1)
        throwTls("cannot restrict TLS protocol versions");
    // peers of an FTP data connection often drop TCP without close_notify
    ::SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
    return ctx;
}

// Hands the context to a TlsConfig; ctx keeps it if the allocation throws.
std::shared_ptr<TlsConfig> adopt(CtxPtr ctx) {
    auto cfg = std::make_shared<TlsConfig>(ctx.get());
    (void)ctx.release();
    return cfg;
}

} // namespace

TlsConfig::TlsConfig(SSL_CTX* ctx) noexcept
  : m_ctx(ctx)
{
}

TlsConfig::~TlsConfig() {
    if (m_ctx) ::SSL_CTX_free(m_ctx);
}

std::shared_ptr<const TlsConfig> TlsConfig::fromFiles(const std::string& certFile,
                                                      const std::string& keyFile)
{
    auto cfg = adopt(newContext(::TLS_server_method()));
    SSL_CTX* ctx = cfg->native();

    if (::SSL_CTX_use_certificate_chain_file(ctx, certFile.c_str()) != 1)
        throwTls("cannot load certificate chain from " + certFile);
    if (::SSL_CTX_use_PrivateKey_file(ctx, keyFile.c_str(), SSL_FILETYPE_PEM) != 1)
        throwTls("cannot load private key from " + keyFile);
    if (::SSL_CTX_check_private_key(ctx) != 1)
        throwTls("private key " + keyFile + " does not match " + certFile);

    return cfg;
}

std::shared_ptr<const TlsConfig> TlsConfig::fromPem(const std::string& certPem,
                                                    const std::string& keyPem)
{
    auto cfg = adopt(newContext(::TLS_server_method()));
    SSL_CTX* ctx = cfg->native();

    // 1) leaf certificate followed by any intermediates
    BioPtr certBio(::BIO_new_mem_buf(certPem.data(), static_cast<int>(certPem.size())));
    if (!certBio) throwTls("cannot allocate certificate buffer");

    X509Ptr leaf(::PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr));
    if (!leaf) throwTls("malformed PEM certificate");
    if (::SSL_CTX_use_certificate(ctx, leaf.get()) != 1)
        throwTls("certificate rejected");

    while (X509* extra = ::PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr)) {
        // add0 takes ownership on success
        if (::SSL_CTX_add0_chain_cert(ctx, extra) != 1) {
            ::X509_free(extra);
            throwTls("intermediate certificate rejected");
        }
    }
    // reading past the last certificate leaves a PEM_R_NO_START_LINE behind
    ::ERR_clear_error();

    // 2) private key
    BioPtr keyBio(::BIO_new_mem_buf(keyPem.data(), static_cast<int>(keyPem.size())));
    if (!keyBio) throwTls("cannot allocate key buffer");

    PkeyPtr key(::PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr));
    if (!key) throwTls("malformed PEM private key");
    if (::SSL_CTX_use_PrivateKey(ctx, key.get()) != 1)
        throwTls("private key rejected");
    if (::SSL_CTX_check_private_key(ctx) != 1)
        throwTls("private key does not match certificate");

    return cfg;
}

std::shared_ptr<const TlsConfig> TlsConfig::client(bool verifyPeer) {
    auto cfg = adopt(newContext(::TLS_client_method()));
    SSL_CTX* ctx = cfg->native();

    if (verifyPeer) {
        if (::SSL_CTX_set_default_verify_paths(ctx) != 1)
            throwTls("cannot load default trust store");
        ::SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        ::SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    }
    return cfg;
}

} // namespace ftp_data
