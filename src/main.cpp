#include <QCoreApplication>
#include <QLoggingCategory>

#include "app/Application.h"
#include "app/Logging.h"

// Eigen3
#include <Eigen/Core>

// OpenCASCADE (OCCT)
#include <Standard_Version.hxx>

#include <cstdio>

Q_LOGGING_CATEGORY(logMain, "roomtrace.main")

int main(int argc, char* argv[]) {
#ifdef NDEBUG
    constexpr bool debugBuild = false;
#else
    constexpr bool debugBuild = true;
#endif

    QCoreApplication::setApplicationName(roomtrace::app::Application::appName());
    QCoreApplication::setApplicationVersion(roomtrace::app::Application::appVersion());
    QCoreApplication::setOrganizationName(roomtrace::app::Application::orgName());
    QCoreApplication::setOrganizationDomain(roomtrace::app::Application::orgDomain());

    QCoreApplication app(argc, argv);

    const roomtrace::app::ParseResult parsed =
        roomtrace::app::Application::parseArguments(QCoreApplication::arguments());

    roomtrace::app::LoggingOptions logging;
    logging.debugBuild = debugBuild;
    logging.verbose = parsed.options.verbose;
    logging.logFilePath = parsed.options.logFilePath;
    QString loggingError;
    if (!roomtrace::app::Logging::initialize(logging, loggingError)) {
        std::fprintf(stderr, "%s\n", qPrintable(loggingError));
        return roomtrace::app::exit_code::UsageError;
    }

    qCInfo(logMain) << "Application startup initiated"
                   << "argc=" << argc
                   << "debugBuild=" << debugBuild;
    qCInfo(logMain) << "Dependency versions"
                   << "occt=" << OCC_VERSION_COMPLETE
                   << "eigen=" << EIGEN_WORLD_VERSION << "." << EIGEN_MAJOR_VERSION << "." << EIGEN_MINOR_VERSION
                   << "qt=" << qVersion();

    int result = roomtrace::app::exit_code::Success;
    switch (parsed.status) {
        case roomtrace::app::ParseStatus::Ok:
            result = roomtrace::app::Application::run(parsed.options);
            break;
        case roomtrace::app::ParseStatus::HelpRequested:
            std::fputs(qPrintable(parsed.helpText), stdout);
            break;
        case roomtrace::app::ParseStatus::VersionRequested:
            std::printf("%s %s\n",
                        qPrintable(QCoreApplication::applicationName()),
                        qPrintable(QCoreApplication::applicationVersion()));
            break;
        case roomtrace::app::ParseStatus::Error:
            qCCritical(logMain) << "Invalid arguments:" << parsed.errorMessage;
            std::fprintf(stderr, "%s\nTry '--help' for usage.\n", qPrintable(parsed.errorMessage));
            result = roomtrace::app::exit_code::UsageError;
            break;
    }

    qCInfo(logMain) << "Exiting" << "exitCode=" << result;
    roomtrace::app::Logging::shutdown();
    return result;
}
