/**
 * @file   session_logger.cpp
 * @brief  Implements the Qt and stream session loggers.
 *
 * @date   2026-10-19
 */

#include "session_logger.hpp"

#include <exception>
#include <ostream>
#include <QDebug>
#include <QString>

Q_LOGGING_CATEGORY(lcDataChannel, "ftp_data.channel")

namespace ftp_data {

void ISessionLogger::print(const std::string& sessionId,
                           const std::error_code& ec) noexcept
{
    try {
        print(sessionId, ec.message());
    }
    catch (const std::exception&) {
        // message() allocates; nothing sensible is left to report on OOM
    }
}

void ISessionLogger::print(const std::string& sessionId,
                           const char* context,
                           const std::error_code& ec) noexcept
{
    try {
        print(sessionId, std::string(context) + ": " + ec.message());
    }
    catch (const std::exception&) {
        // as above
    }
}

void QtSessionLogger::print(const std::string& sessionId,
                            const std::string& message) noexcept
{
    try {
        qCInfo(lcDataChannel).noquote()
            << QStringLiteral("[%1]").arg(QString::fromStdString(sessionId))
            << QString::fromStdString(message);
    }
    catch (const std::exception&) {
        // QString conversion allocates; drop the line rather than throw
    }
}

StreamSessionLogger::StreamSessionLogger(std::ostream& out)
  : m_out(out)
{
}

void StreamSessionLogger::print(const std::string& sessionId,
                                const std::string& message) noexcept
{
    std::lock_guard<std::mutex> lk(m_mtx);
    m_out << '[' << sessionId << "] " << message << '\n';
    m_out.flush();
}

} // namespace ftp_data
