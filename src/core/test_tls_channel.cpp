// test_tls_channel.cpp
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <thread>

#include <unistd.h>

#include "test_support.hpp"
#include "io/passive_channel.hpp"
#include "io/tls_config.hpp"

using namespace std::chrono_literals;
using namespace test_support;
using ftp_data::ChannelErrc;
using ftp_data::ChannelError;
using ftp_data::IoResult;
using ftp_data::PassiveChannel;
using ftp_data::TlsConfig;

namespace fs = std::filesystem;

namespace {

std::string g_certPem;
std::string g_keyPem;

void tlsEndToEnd() {
    std::cout << "TLS passive channel exchanges bytes like plaintext\n";
    auto logger = std::make_shared<RecordingLogger>();
    PassiveChannel channel("127.0.0.1", 0, logger, "s-tls",
                           TlsConfig::fromPem(g_certPem, g_keyPem));
    auto clientTls = TlsConfig::client();
    const std::string payload = makePayload(300000);

    auto client = std::async(std::launch::async, [&]{
        ftp_data::SocketStream s = dialLoopback(channel.port());
        if (s.startTls(*clientTls, ftp_data::TlsRole::Client)) return std::string("handshake failed");
        IoResult w = s.write(payload.data(), payload.size());
        if (w.error) return std::string("write failed");
        std::string reply = readExactly(s, 3);
        (void)s.close();
        return reply;
    });

    std::string got;
    char buf[8192];
    while (got.size() < payload.size()) {
        IoResult r = channel.read(buf, sizeof(buf));
        got.append(buf, r.bytes);
        if (r.error) break;
    }
    check(got == payload, "server reads the decrypted payload unchanged");

    IoResult w = channel.write("226", 3);
    check(!w.error && w.bytes == 3, "server writes over TLS");
    check(client.get() == "226", "client reads the server's reply");
    check(logger->contains("s-tls Passive data connection established (TLS)"),
          "TLS accept is logged");
    check(!channel.close(), "close() sends close_notify without error");
}

void plaintextClientFailsHandshake() {
    std::cout << "plaintext client on a TLS channel fails the accept\n";
    auto logger = std::make_shared<RecordingLogger>();
    PassiveChannel channel("127.0.0.1", 0, logger, "s-plain",
                           TlsConfig::fromPem(g_certPem, g_keyPem));

    {
        ftp_data::SocketStream s = dialLoopback(channel.port());
        check(!s.write("STOR file\r\n", 11).error, "plaintext client writes");
    }   // hang up

    auto reader = std::async(std::launch::async, [&]{
        char buf[16];
        return channel.read(buf, sizeof(buf)).error;
    });
    check(reader.wait_for(5s) == std::future_status::ready, "read() does not hang");

    std::error_code first = reader.get();
    check(static_cast<bool>(first), "read() fails");

    char c;
    check(channel.write(&c, 1).error == first, "write() observes the same recorded error");
    check(logger->contains("s-plain passive accept:"), "handshake failure is logged");
}

void closeDuringHandshakeResolves() {
    std::cout << "close during a stalled handshake resolves the channel\n";
    auto logger = std::make_shared<RecordingLogger>();
    PassiveChannel channel("127.0.0.1", 0, logger, "s-stall",
                           TlsConfig::fromPem(g_certPem, g_keyPem));

    // connects but never speaks TLS
    ftp_data::SocketStream idle = dialLoopback(channel.port());
    std::this_thread::sleep_for(100ms);

    check(!channel.close(), "close() returns no error");
    auto waiter = std::async(std::launch::async, [&]{ return channel.waitReady(); });
    check(waiter.wait_for(5s) == std::future_status::ready, "accept thread resolves");
    check(waiter.get() == ChannelErrc::Closed, "outcome is Closed");
}

void closeDuringReadUnblocks() {
    std::cout << "close while a TLS read is blocked wakes the reader\n";
    auto logger = std::make_shared<RecordingLogger>();
    PassiveChannel channel("127.0.0.1", 0, logger, "s-tls-abort",
                           TlsConfig::fromPem(g_certPem, g_keyPem));
    auto clientTls = TlsConfig::client();

    ftp_data::SocketStream client = dialLoopback(channel.port());
    check(!client.startTls(*clientTls, ftp_data::TlsRole::Client), "client handshake succeeds");
    check(!channel.waitReady(), "TLS connection accepted");

    std::error_code readErr, closeErr;
    check(closeWhileReading(channel, readErr, closeErr), "reader blocks, then returns after close()");
    check(readErr == ChannelErrc::Closed, "blocked TLS read reports Closed");
    check(!closeErr, "close() returns no error");

    char c;
    check(channel.read(&c, 1).error == ChannelErrc::Closed, "later reads report Closed");
    check(client.read(&c, 1).error == ChannelErrc::EndOfStream, "client sees end of stream");
}

void badMaterialIsRejected() {
    std::cout << "unusable TLS material is rejected\n";

    bool threw = false;
    try {
        TlsConfig::fromPem("not a certificate", g_keyPem);
    }
    catch (const ChannelError& e) {
        threw = e.code().category() == ftp_data::tls_category();
    }
    check(threw, "malformed certificate throws a TLS error");

    std::string otherCert, otherKey;
    check(makeSelfSignedPem(otherCert, otherKey), "second key pair generated");
    threw = false;
    try {
        TlsConfig::fromPem(g_certPem, otherKey);
    }
    catch (const ChannelError&) {
        threw = true;
    }
    check(threw, "mismatching key throws");

    threw = false;
    try {
        TlsConfig::fromFiles("/nonexistent/server.pem", "/nonexistent/server.key");
    }
    catch (const ChannelError&) {
        threw = true;
    }
    check(threw, "missing files throw");
}

void loadsFromFiles() {
    std::cout << "TLS material loads from PEM files\n";
    const fs::path dir = fs::temp_directory_path();
    const fs::path cert = dir / ("ftp_data_cert_" + std::to_string(::getpid()) + ".pem");
    const fs::path key  = dir / ("ftp_data_key_"  + std::to_string(::getpid()) + ".pem");
    std::ofstream(cert) << g_certPem;
    std::ofstream(key)  << g_keyPem;

    bool ok = true;
    try {
        auto cfg = TlsConfig::fromFiles(cert.string(), key.string());
        ok = cfg && cfg->native();
    }
    catch (const ChannelError& e) {
        std::cout << "  " << e.what() << "\n";
        ok = false;
    }
    check(ok, "fromFiles() builds a context");

    std::error_code ec;
    fs::remove(cert, ec);
    fs::remove(key, ec);
}

} // namespace

int main() {
    std::signal(SIGPIPE, SIG_IGN);

    if (!makeSelfSignedPem(g_certPem, g_keyPem)) {
        std::cerr << "cannot generate test certificate\n";
        return 1;
    }

    tlsEndToEnd();
    plaintextClientFailsHandshake();
    closeDuringHandshakeResolves();
    closeDuringReadUnblocks();
    badMaterialIsRejected();
    loadsFromFiles();

    return summary("test_tls_channel");
}
