#ifndef ROOMTRACE_APP_APPLICATION_H
#define ROOMTRACE_APP_APPLICATION_H

#include "../core/space/SpaceTypes.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace roomtrace {
namespace app {

/**
 * @brief Options of one roomtrace run.
 */
struct RunOptions {
    QString inputPath;
    QString outputPath;
    std::optional<core::space::Point2D> queryPoint;
    std::optional<double> tolerance;
    bool counterClockwise = false;
    bool verbose = false;
    QString logFilePath;
};

enum class ParseStatus {
    Ok,
    Error,
    HelpRequested,
    VersionRequested
};

struct ParseResult {
    ParseStatus status = ParseStatus::Ok;
    RunOptions options;
    QString errorMessage;
    QString helpText;
};

namespace exit_code {
constexpr int Success = 0;
constexpr int InputError = 1;
constexpr int UsageError = 2;
} // namespace exit_code

/**
 * @brief Command line controller for roomtrace.
 *
 * Reads a wall file, runs whole-plan or point detection and writes the
 * result as JSON.
 */
class Application {
public:
    // Application metadata
    static QString appName() { return QStringLiteral("RoomTrace"); }
    static QString appVersion() { return QStringLiteral("0.1.0"); }
    static QString orgName() { return QStringLiteral("RoomTrace"); }
    static QString orgDomain() { return QStringLiteral("roomtrace.dev"); }

    /**
     * @brief Parse the process arguments (arguments[0] is the program).
     */
    static ParseResult parseArguments(const QStringList& arguments);

    /**
     * @brief Parse "x,y".
     */
    static std::optional<core::space::Point2D> parsePoint(const QString& text);

    /**
     * @brief Run detection and write the result.
     * @return One of the exit_code values
     */
    static int run(const RunOptions& options);

private:
    Application() = delete;
};

} // namespace app
} // namespace roomtrace

#endif // ROOMTRACE_APP_APPLICATION_H
