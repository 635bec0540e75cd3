/**
 * @file   session_logger.hpp
 * @brief  Declares the ISessionLogger diagnostics sink and its Qt and
 *         std::ostream implementations.
 *
 * Every line is tagged with the identifier of the FTP session that
 * produced it.
 *
 * @date   2026-10-19
 */

#ifndef FTP_DATA_SESSION_LOGGER_HPP
#define FTP_DATA_SESSION_LOGGER_HPP

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcDataChannel)

namespace ftp_data {

/**
 * @class ISessionLogger
 * @brief Sink for session-tagged diagnostic lines.
 *
 * Implementations must not throw and must not block callers for long;
 * the channels log from their constructors and from the accept thread.
 */
class ISessionLogger {
public:
    virtual ~ISessionLogger() = default;

    /**
     * @brief Emits one diagnostic line.
     * @param sessionId  Identifier of the owning session.
     * @param message    Text of the line.
     */
    virtual void print(const std::string& sessionId,
                       const std::string& message) noexcept = 0;

    /// Convenience overload rendering an error with its category message.
    void print(const std::string& sessionId, const std::error_code& ec) noexcept;

    /// Same, prefixed with what was being attempted ("read: <message>").
    void print(const std::string& sessionId,
               const char* context,
               const std::error_code& ec) noexcept;
};

using SessionLoggerPtr = std::shared_ptr<ISessionLogger>;

/**
 * @class QtSessionLogger
 * @brief Routes lines to the `ftp_data.channel` Qt logging category.
 *
 * Output is controlled by the usual QT_LOGGING_RULES machinery.
 */
class QtSessionLogger final : public ISessionLogger {
public:
    using ISessionLogger::print;
    void print(const std::string& sessionId,
               const std::string& message) noexcept override;
};

/**
 * @class StreamSessionLogger
 * @brief Writes `[session] message` lines to a std::ostream.
 */
class StreamSessionLogger final : public ISessionLogger {
public:
    /**
     * @param out  Target stream; must outlive the logger.
     */
    explicit StreamSessionLogger(std::ostream& out);

    using ISessionLogger::print;
    void print(const std::string& sessionId,
               const std::string& message) noexcept override;

private:
    std::ostream& m_out;
    std::mutex    m_mtx;   ///< Keeps lines from interleaving
};

} // namespace ftp_data

#endif // FTP_DATA_SESSION_LOGGER_HPP
