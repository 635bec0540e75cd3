/**
 * @file   datachan_main.cpp
 * @brief  Command-line front end for the data channel transports.
 *
 *   ftp_datachan listen [--config f] [--host h] [--port p] [--output f]
 *   ftp_datachan send <host> <port> [--config f] [--input f]
 *
 * `listen` opens a passive channel, reports `PORT <n>` on stderr and
 * copies whatever the client sends to stdout or the output file.
 * `send` opens an active channel and writes the input file (or stdin).
 *
 * @date   2026-10-19
 */
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>

#include "../../core/channel_config.hpp"
#include "../../core/session_logger.hpp"
#include "../../core/io/active_channel.hpp"
#include "../../core/io/channel_error.hpp"
#include "../../core/io/passive_channel.hpp"
#include "../../core/io/tls_config.hpp"
#include "../../core/io/transfer.hpp"

namespace {

constexpr int EXIT_RUNTIME = 1;
constexpr int EXIT_USAGE   = 2;

/**
 * Builds the server TLS context named by the configuration, or nullptr
 * when TLS is disabled.  Throws ChannelError on unreadable PEM files.
 */
ftp_data::TlsConfigPtr makeTls(const ftp_data::config::ChannelConfig& cfg) {
    if (!cfg.tls.enabled) return nullptr;
    return ftp_data::TlsConfig::fromFiles(cfg.tls.certFile, cfg.tls.keyFile);
}

int runListen(const ftp_data::config::ChannelConfig& cfg,
              const ftp_data::SessionLoggerPtr& logger,
              const QString& outputPath)
{
    ftp_data::PassiveChannel channel(cfg.passive.host, cfg.passive.port,
                                     logger, cfg.sessionId, makeTls(cfg));

    // the protocol layer would put this into its PASV reply
    std::cerr << "PORT " << channel.port() << std::endl;

    std::ofstream file;
    std::ostream* out = &std::cout;
    if (!outputPath.isEmpty()) {
        file.open(outputPath.toStdString(), std::ios::binary);
        if (!file) {
            std::cerr << "[ftp_datachan] ERROR: cannot open " << outputPath.toStdString() << "\n";
            return EXIT_RUNTIME;
        }
        out = &file;
    }

    std::size_t total = 0;
    std::error_code ec = ftp_data::copyToStream(channel, *out, &total);
    std::error_code closeEc = channel.close();
    if (ec || closeEc) {
        std::cerr << "[ftp_datachan] ERROR: " << (ec ? ec : closeEc).message() << "\n";
        return EXIT_RUNTIME;
    }
    logger->print(cfg.sessionId, "received " + std::to_string(total) + " bytes");
    return 0;
}

int runSend(const ftp_data::config::ChannelConfig& cfg,
            const ftp_data::SessionLoggerPtr& logger,
            const std::string& host,
            int port,
            const QString& inputPath)
{
    ftp_data::TlsConfigPtr tls = cfg.active.tls ? makeTls(cfg) : nullptr;
    ftp_data::ActiveChannel channel(host, port, logger, cfg.sessionId, tls);

    std::ifstream file;
    std::istream* in = &std::cin;
    if (!inputPath.isEmpty()) {
        file.open(inputPath.toStdString(), std::ios::binary);
        if (!file) {
            std::cerr << "[ftp_datachan] ERROR: cannot open " << inputPath.toStdString() << "\n";
            return EXIT_RUNTIME;
        }
        in = &file;
    }

    std::size_t total = 0;
    std::error_code ec = ftp_data::copyFromStream(*in, channel, &total);
    std::error_code closeEc = channel.close();
    if (ec || closeEc) {
        std::cerr << "[ftp_datachan] ERROR: " << (ec ? ec : closeEc).message() << "\n";
        return EXIT_RUNTIME;
    }
    logger->print(cfg.sessionId, "sent " + std::to_string(total) + " bytes");
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ftp_datachan");

    // a peer hanging up mid-transfer must surface as EPIPE, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    // 1) Command line ---------------------------------------------------------
    QCommandLineParser parser;
    parser.setApplicationDescription("Opens an FTP data channel and moves raw bytes over it.");
    parser.addHelpOption();
    parser.addPositionalArgument("command", "listen | send");
    parser.addPositionalArgument("args", "send: <host> <port>", "[args...]");

    QCommandLineOption configOpt({"c", "config"}, "JSON configuration file.", "file");
    QCommandLineOption hostOpt("host", "Passive bind host (overrides config).", "host");
    QCommandLineOption portOpt({"p", "port"}, "Passive port, 0 = ephemeral (overrides config).", "port");
    QCommandLineOption outputOpt({"o", "output"}, "listen: write received bytes here.", "file");
    QCommandLineOption inputOpt({"i", "input"}, "send: read bytes to send from here.", "file");
    QCommandLineOption stderrOpt("log-stderr", "Log plain lines to stderr instead of Qt logging.");
    parser.addOptions({configOpt, hostOpt, portOpt, outputOpt, inputOpt, stderrOpt});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        std::cerr << "[ftp_datachan] ERROR: missing command\n";
        return EXIT_USAGE;
    }

    // 2) Configuration --------------------------------------------------------
    ftp_data::config::ChannelConfig cfg;
    if (parser.isSet(configOpt)) {
        std::string err;
        if (!ftp_data::config::loadFile(parser.value(configOpt).toStdString(), cfg, &err)) {
            std::cerr << "[ftp_datachan] ERROR: " << err << "\n";
            return EXIT_USAGE;
        }
    }
    if (parser.isSet(hostOpt))
        cfg.passive.host = parser.value(hostOpt).toStdString();
    if (parser.isSet(portOpt)) {
        bool ok = false;
        cfg.passive.port = parser.value(portOpt).toInt(&ok);
        if (!ok) {
            std::cerr << "[ftp_datachan] ERROR: --port expects a number\n";
            return EXIT_USAGE;
        }
    }
    std::string err;
    if (!ftp_data::config::validate(cfg, &err)) {
        std::cerr << "[ftp_datachan] ERROR: " << err << "\n";
        return EXIT_USAGE;
    }

    ftp_data::SessionLoggerPtr logger;
    if (parser.isSet(stderrOpt))
        logger = std::make_shared<ftp_data::StreamSessionLogger>(std::cerr);
    else
        logger = std::make_shared<ftp_data::QtSessionLogger>();

    // 3) Run ------------------------------------------------------------------
    const QString command = args.first();
    try {
        if (command == "listen")
            return runListen(cfg, logger, parser.value(outputOpt));

        if (command == "send") {
            if (args.size() != 3) {
                std::cerr << "[ftp_datachan] ERROR: send needs <host> <port>\n";
                return EXIT_USAGE;
            }
            bool ok = false;
            const int port = args.at(2).toInt(&ok);
            if (!ok) {
                std::cerr << "[ftp_datachan] ERROR: port must be a number\n";
                return EXIT_USAGE;
            }
            return runSend(cfg, logger, args.at(1).toStdString(), port,
                           parser.value(inputOpt));
        }
    }
    catch (const ftp_data::ChannelError& e) {
        std::cerr << "[ftp_datachan] ERROR: " << e.what() << "\n";
        return EXIT_RUNTIME;
    }

    std::cerr << "[ftp_datachan] ERROR: unknown command " << command.toStdString() << "\n";
    return EXIT_USAGE;
}
