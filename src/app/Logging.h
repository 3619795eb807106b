#ifndef ROOMTRACE_APP_LOGGING_H
#define ROOMTRACE_APP_LOGGING_H

#include <QString>

namespace roomtrace::app {

/**
 * @brief Logging setup for one roomtrace invocation.
 */
struct LoggingOptions {
    bool debugBuild = false;

    /// Echo info lines to stderr, not only warnings and errors
    bool verbose = false;

    /// Log file receiving every enabled line; empty falls back to
    /// ROOMTRACE_LOG_FILE, and to console only when that is unset too
    QString logFilePath;
};

/**
 * @brief Qt message handler for the command line tool.
 *
 * stdout is reserved for JSON output, so console lines go to stderr.
 */
class Logging {
public:
    /**
     * @return false if a requested log file cannot be opened
     */
    static bool initialize(const LoggingOptions& options, QString& errorMessage);
    static void shutdown();

    /**
     * @brief Tag subsequent log file lines with the wall file being processed.
     */
    static void setRunContext(const QString& inputPath);

    static QString logFilePath();
    static bool isDebugLoggingEnabled();

    /// QLoggingCategory filter rules for @p options and the environment
    static QString filterRules(const LoggingOptions& options);

private:
    Logging() = delete;
};

} // namespace roomtrace::app

#endif // ROOMTRACE_APP_LOGGING_H
