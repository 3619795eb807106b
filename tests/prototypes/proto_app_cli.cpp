#include "test_harness/TestHarness.h"
#include "fixtures/WallFixtures.h"
#include "app/Application.h"
#include "io/SpaceJson.h"

#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

using roomtrace::app::Application;
using roomtrace::app::ParseStatus;
namespace exit_code = roomtrace::app::exit_code;

namespace {

QStringList args(std::initializer_list<const char*> list) {
    QStringList result{QStringLiteral("roomtrace")};
    for (const char* item : list) {
        result << QString::fromUtf8(item);
    }
    return result;
}

QJsonObject readJson(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return QJsonDocument::fromJson(file.readAll()).object();
}

} // namespace

TEST_CASE(Parse_Full_Command_Line) {
    const auto parsed = Application::parseArguments(
        args({"--at", "2.5,-1", "--tolerance", "0.1", "--ccw", "--output", "out.json", "plan.json"}));
    EXPECT_TRUE(parsed.status == ParseStatus::Ok);
    EXPECT_EQ(parsed.options.inputPath.toStdString(), std::string("plan.json"));
    EXPECT_EQ(parsed.options.outputPath.toStdString(), std::string("out.json"));
    EXPECT_TRUE(parsed.options.counterClockwise);
    EXPECT_TRUE(parsed.options.queryPoint.has_value());
    if (parsed.options.queryPoint) {
        EXPECT_VEC2_NEAR(*parsed.options.queryPoint, (roomtrace::core::space::Point2D{2.5, -1.0}), 1e-12);
    }
    EXPECT_NEAR(parsed.options.tolerance.value_or(0.0), 0.1, 1e-12);
    EXPECT_FALSE(parsed.options.verbose);

    const auto logged = Application::parseArguments(args({"-V", "--log-file", "run.log", "plan.json"}));
    EXPECT_TRUE(logged.status == ParseStatus::Ok);
    EXPECT_TRUE(logged.options.verbose);
    EXPECT_EQ(logged.options.logFilePath.toStdString(), std::string("run.log"));
}

TEST_CASE(Parse_Defaults_And_Errors) {
    const auto plain = Application::parseArguments(args({"plan.json"}));
    EXPECT_TRUE(plain.status == ParseStatus::Ok);
    EXPECT_FALSE(plain.options.queryPoint.has_value());
    EXPECT_FALSE(plain.options.tolerance.has_value());
    EXPECT_FALSE(plain.options.counterClockwise);
    EXPECT_TRUE(plain.options.outputPath.isEmpty());

    EXPECT_TRUE(Application::parseArguments(args({})).status == ParseStatus::Error);
    EXPECT_TRUE(Application::parseArguments(args({"a.json", "b.json"})).status == ParseStatus::Error);
    EXPECT_TRUE(Application::parseArguments(args({"--at", "2", "plan.json"})).status == ParseStatus::Error);
    EXPECT_TRUE(Application::parseArguments(args({"--tolerance", "0", "plan.json"})).status == ParseStatus::Error);
    EXPECT_TRUE(Application::parseArguments(args({"--bogus", "plan.json"})).status == ParseStatus::Error);

    const auto help = Application::parseArguments(args({"--help"}));
    EXPECT_TRUE(help.status == ParseStatus::HelpRequested);
    EXPECT_TRUE(help.helpText.contains("--tolerance"));
}

TEST_CASE(Parse_Point) {
    EXPECT_TRUE(Application::parsePoint(" 1.5 , 2 ").has_value());
    EXPECT_FALSE(Application::parsePoint("1.5").has_value());
    EXPECT_FALSE(Application::parsePoint("a,b").has_value());
    EXPECT_FALSE(Application::parsePoint("1,2,3").has_value());
}

TEST_CASE(Run_Writes_Results) {
    QTemporaryDir dir;
    EXPECT_TRUE(dir.isValid());

    roomtrace::io::WallFile plan;
    plan.walls = roomtrace::test::twoRoomsSideBySide();
    QString error;
    const QString input = dir.filePath("plan.json");
    EXPECT_TRUE(roomtrace::io::SpaceJson::writeFile(input, roomtrace::io::SpaceJson::serializeWallFile(plan), error));

    roomtrace::app::RunOptions all;
    all.inputPath = input;
    all.outputPath = dir.filePath("all.json");
    EXPECT_EQ(Application::run(all), exit_code::Success);
    EXPECT_EQ(readJson(all.outputPath).value("spaces").toArray().size(), qsizetype{2});

    roomtrace::app::RunOptions point = all;
    point.outputPath = dir.filePath("point.json");
    point.queryPoint = roomtrace::core::space::Point2D{6.0, 1.5};
    EXPECT_EQ(Application::run(point), exit_code::Success);
    EXPECT_TRUE(readJson(point.outputPath).value("space").isObject());

    point.queryPoint = roomtrace::core::space::Point2D{50.0, 50.0};
    EXPECT_EQ(Application::run(point), exit_code::Success);

    roomtrace::app::RunOptions missing;
    missing.inputPath = dir.filePath("missing.json");
    missing.outputPath = dir.filePath("never.json");
    EXPECT_EQ(Application::run(missing), exit_code::InputError);
    EXPECT_FALSE(QFile::exists(missing.outputPath));
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    return roomtrace::test::runAllTests();
}
