#include "Logging.h"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>
#include <QTextStream>

#include <cstdlib>
#include <iostream>

namespace roomtrace::app {

Q_LOGGING_CATEGORY(logLogging, "roomtrace.logging")

namespace {

QMutex gLogMutex;
QFile gLogFile;
QString gRunContext;
QtMessageHandler gPreviousHandler = nullptr;
QtMsgType gConsoleThreshold = QtWarningMsg;
bool gInitialized = false;
bool gDebugLoggingEnabled = false;

const char* levelToString(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return "DEBUG";
        case QtInfoMsg:
            return "INFO";
        case QtWarningMsg:
            return "WARN";
        case QtCriticalMsg:
            return "ERROR";
        case QtFatalMsg:
            return "FATAL";
    }
    return "UNKNOWN";
}

// QtMsgType is not ordered by severity: QtInfoMsg comes after QtFatalMsg.
int severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return 0;
        case QtInfoMsg:
            return 1;
        case QtWarningMsg:
            return 2;
        case QtCriticalMsg:
            return 3;
        case QtFatalMsg:
            return 4;
    }
    return 4;
}

bool isEnabledFlag(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

bool debugRequested(const LoggingOptions& options) {
    return options.debugBuild || isEnabledFlag(qEnvironmentVariable("ROOMTRACE_LOG_DEBUG"));
}

QString categoryName(const QMessageLogContext& context) {
    return context.category ? QString::fromUtf8(context.category) : QStringLiteral("default");
}

// roomtrace: WARN roomtrace.io: Invalid wall at index 2
QString formatConsoleLine(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    return QStringLiteral("roomtrace: %1 %2: %3")
        .arg(QString::fromLatin1(levelToString(type)), categoryName(context), msg);
}

// 2026-10-19T10:00:00.123 [INFO] [roomtrace.core.space.detector] [plan.json] Detected spaces ...
QString formatFileLine(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    QString line = QStringLiteral("%1 [%2] [%3]")
                       .arg(timestamp, QString::fromLatin1(levelToString(type)), categoryName(context));
    if (!gRunContext.isEmpty()) {
        line += QStringLiteral(" [%1]").arg(gRunContext);
    }
    if (type != QtInfoMsg && context.file && context.line > 0) {
        line += QStringLiteral(" [%1:%2]").arg(QString::fromUtf8(context.file)).arg(context.line);
    }
    return line + QLatin1Char(' ') + msg;
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    {
        QMutexLocker lock(&gLogMutex);
        if (gLogFile.isOpen()) {
            QTextStream stream(&gLogFile);
            stream << formatFileLine(type, context, msg) << Qt::endl;
            gLogFile.flush();
        }
    }

    if (severity(type) >= severity(gConsoleThreshold)) {
        std::cerr << formatConsoleLine(type, context, msg).toStdString() << std::endl;
    }

    if (type == QtFatalMsg) {
        std::abort();
    }
}

} // namespace

QString Logging::filterRules(const LoggingOptions& options) {
    QStringList rules;
    rules << QStringLiteral("*.debug=false");
    rules << QStringLiteral("*.info=false");
    rules << QStringLiteral("roomtrace.info=true");
    rules << QStringLiteral("roomtrace.*.info=true");
    rules << QStringLiteral("*.warning=true");
    rules << QStringLiteral("*.critical=true");

    if (debugRequested(options)) {
        rules << QStringLiteral("roomtrace.*.debug=true");
        return rules.join('\n');
    }

    // e.g. ROOMTRACE_LOG_DEBUG_CATEGORIES=roomtrace.core.space.cycles,roomtrace.core.space.raycast
    const QString configured = qEnvironmentVariable("ROOMTRACE_LOG_DEBUG_CATEGORIES");
    QStringList categories;
    for (const QString& token : configured.split(',', Qt::SkipEmptyParts)) {
        const QString category = token.trimmed();
        if (!category.isEmpty() && !categories.contains(category)) {
            categories.push_back(category);
        }
    }
    for (const QString& category : categories) {
        rules << QStringLiteral("%1.debug=true").arg(category);
        rules << QStringLiteral("%1.*.debug=true").arg(category);
    }
    return rules.join('\n');
}

bool Logging::initialize(const LoggingOptions& options, QString& errorMessage) {
    QString openedPath;

    {
        QMutexLocker lock(&gLogMutex);
        if (gInitialized) {
            return true;
        }

        const QString path = options.logFilePath.isEmpty()
                                 ? qEnvironmentVariable("ROOMTRACE_LOG_FILE").trimmed()
                                 : options.logFilePath;
        if (!path.isEmpty()) {
            gLogFile.setFileName(path);
            if (!gLogFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                errorMessage = QStringLiteral("Failed to open log file %1: %2").arg(path, gLogFile.errorString());
                return false;
            }
            openedPath = QFileInfo(path).absoluteFilePath();
        }

        gDebugLoggingEnabled = debugRequested(options);
        // Debug builds only widen what reaches the log file.
        const bool consoleVerbose = options.verbose || isEnabledFlag(qEnvironmentVariable("ROOMTRACE_LOG_DEBUG"));
        gConsoleThreshold = consoleVerbose ? QtDebugMsg : QtWarningMsg;
        gRunContext.clear();
        QLoggingCategory::setFilterRules(filterRules(options));
        gPreviousHandler = qInstallMessageHandler(messageHandler);
        gInitialized = true;
    }

    qCInfo(logLogging).noquote() << "Logging initialized"
                                 << "logFile=" << (openedPath.isEmpty() ? QStringLiteral("<none>") : openedPath)
                                 << "verbose=" << options.verbose
                                 << "debugLogsEnabled=" << gDebugLoggingEnabled;
    return true;
}

void Logging::shutdown() {
    QMutexLocker lock(&gLogMutex);
    if (!gInitialized) {
        return;
    }

    qInstallMessageHandler(gPreviousHandler);
    gPreviousHandler = nullptr;

    if (gLogFile.isOpen()) {
        gLogFile.flush();
        gLogFile.close();
    }
    gLogFile.setFileName(QString());
    gRunContext.clear();
    gInitialized = false;
}

void Logging::setRunContext(const QString& inputPath) {
    QMutexLocker lock(&gLogMutex);
    gRunContext = QFileInfo(inputPath).fileName();
}

QString Logging::logFilePath() {
    QMutexLocker lock(&gLogMutex);
    return gLogFile.isOpen() ? QFileInfo(gLogFile.fileName()).absoluteFilePath() : QString();
}

bool Logging::isDebugLoggingEnabled() {
    QMutexLocker lock(&gLogMutex);
    return gDebugLoggingEnabled;
}

} // namespace roomtrace::app
