#include "Application.h"
#include "Logging.h"

#include "../core/space/SpaceDetector.h"
#include "../io/SpaceJson.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QLoggingCategory>

#include <cstdio>
#include <vector>

namespace roomtrace::app {

Q_LOGGING_CATEGORY(logApp, "roomtrace.app")

using core::space::DetectedSpace;
using core::space::Point2D;
using core::space::SpaceDetector;

std::optional<Point2D> Application::parsePoint(const QString& text) {
    const QStringList parts = text.split(',');
    if (parts.size() != 2) {
        return std::nullopt;
    }
    bool okX = false;
    bool okY = false;
    const double x = parts[0].trimmed().toDouble(&okX);
    const double y = parts[1].trimmed().toDouble(&okY);
    if (!okX || !okY) {
        return std::nullopt;
    }
    return Point2D{x, y};
}

ParseResult Application::parseArguments(const QStringList& arguments) {
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Detect enclosed rooms in a wall layout and print them as JSON."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption atOption(QStringLiteral("at"),
                                      QStringLiteral("Detect only the space containing the point."),
                                      QStringLiteral("x,y"));
    const QCommandLineOption toleranceOption(QStringLiteral("tolerance"),
                                             QStringLiteral("Endpoint merge tolerance in metres."),
                                             QStringLiteral("m"));
    const QCommandLineOption ccwOption(QStringLiteral("ccw"),
                                       QStringLiteral("Orient output boundaries counter-clockwise."));
    const QCommandLineOption outputOption(QStringList() << QStringLiteral("o") << QStringLiteral("output"),
                                          QStringLiteral("Write JSON to <file> instead of stdout."),
                                          QStringLiteral("file"));
    const QCommandLineOption verboseOption(QStringList() << QStringLiteral("V") << QStringLiteral("verbose"),
                                           QStringLiteral("Print progress messages on stderr."));
    const QCommandLineOption logFileOption(QStringLiteral("log-file"),
                                           QStringLiteral("Append log lines to <file>."),
                                           QStringLiteral("file"));
    parser.addOption(atOption);
    parser.addOption(toleranceOption);
    parser.addOption(ccwOption);
    parser.addOption(outputOption);
    parser.addOption(verboseOption);
    parser.addOption(logFileOption);
    parser.addPositionalArgument(QStringLiteral("walls"), QStringLiteral("Wall file (JSON)."));

    ParseResult result;
    if (!parser.parse(arguments)) {
        result.status = ParseStatus::Error;
        result.errorMessage = parser.errorText();
        return result;
    }
    if (parser.isSet(helpOption)) {
        result.status = ParseStatus::HelpRequested;
        result.helpText = parser.helpText();
        return result;
    }
    if (parser.isSet(versionOption)) {
        result.status = ParseStatus::VersionRequested;
        return result;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        result.status = ParseStatus::Error;
        result.errorMessage = positional.isEmpty() ? QStringLiteral("Missing wall file argument")
                                                   : QStringLiteral("Expected exactly one wall file");
        return result;
    }
    result.options.inputPath = positional.front();

    if (parser.isSet(atOption)) {
        result.options.queryPoint = parsePoint(parser.value(atOption));
        if (!result.options.queryPoint) {
            result.status = ParseStatus::Error;
            result.errorMessage = QStringLiteral("--at expects <x>,<y>, got '%1'").arg(parser.value(atOption));
            return result;
        }
    }

    if (parser.isSet(toleranceOption)) {
        bool ok = false;
        const double tolerance = parser.value(toleranceOption).toDouble(&ok);
        if (!ok || tolerance <= 0.0) {
            result.status = ParseStatus::Error;
            result.errorMessage = QStringLiteral("--tolerance expects a positive number, got '%1'")
                                      .arg(parser.value(toleranceOption));
            return result;
        }
        result.options.tolerance = tolerance;
    }

    result.options.counterClockwise = parser.isSet(ccwOption);
    result.options.outputPath = parser.value(outputOption);
    result.options.verbose = parser.isSet(verboseOption);
    result.options.logFilePath = parser.value(logFileOption);
    return result;
}

int Application::run(const RunOptions& options) {
    Logging::setRunContext(options.inputPath);

    io::WallFile wallFile;
    QString errorMessage;
    if (!io::SpaceJson::loadWallFile(options.inputPath, wallFile, errorMessage)) {
        qCCritical(logApp) << "Failed to load wall file" << errorMessage;
        return exit_code::InputError;
    }

    core::space::SpaceDetectorConfig config = wallFile.config;
    if (options.tolerance) {
        config.mergeTolerance = *options.tolerance;
    }
    if (options.counterClockwise) {
        config.orientCounterClockwise = true;
    }

    qCInfo(logApp) << "Detection started"
                   << "input=" << options.inputPath
                   << "walls=" << wallFile.walls.size()
                   << "tolerance=" << config.mergeTolerance
                   << "pointQuery=" << options.queryPoint.has_value();

    const SpaceDetector detector(config);
    QByteArray output;
    if (options.queryPoint) {
        const std::optional<DetectedSpace> space =
            detector.detectSpaceAtPoint(*options.queryPoint, wallFile.walls);
        qCInfo(logApp) << "Point query finished"
                       << "found=" << space.has_value()
                       << "area=" << (space ? space->area : 0.0);
        output = io::SpaceJson::serializeSpaceQuery(space);
    } else {
        const std::vector<DetectedSpace> spaces = detector.detectSpaces(wallFile.walls);
        qCInfo(logApp) << "Detection finished" << "spaces=" << spaces.size();
        output = io::SpaceJson::serializeSpaces(spaces);
    }

    if (options.outputPath.isEmpty()) {
        std::fwrite(output.constData(), 1, static_cast<size_t>(output.size()), stdout);
        std::fflush(stdout);
        return exit_code::Success;
    }

    if (!io::SpaceJson::writeFile(options.outputPath, output, errorMessage)) {
        qCCritical(logApp) << "Failed to write output" << errorMessage;
        return exit_code::InputError;
    }
    qCInfo(logApp) << "Result written" << "output=" << options.outputPath;
    return exit_code::Success;
}

} // namespace roomtrace::app
