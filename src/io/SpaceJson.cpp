/**
 * @file SpaceJson.cpp
 * @brief Implementation of wall file and detection result serialization
 */

#include "SpaceJson.h"

#include <QFile>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSaveFile>

#include <cmath>
#include <limits>

namespace roomtrace::io {

using namespace core::space;

Q_LOGGING_CATEGORY(logSpaceJson, "roomtrace.io")

namespace {

bool readPositiveDouble(const QJsonObject& json, const QString& key, double& out, QString& errorMessage) {
    if (!json.contains(key)) {
        return true;
    }
    const QJsonValue value = json.value(key);
    if (!value.isDouble() || !(value.toDouble() > 0.0)) {
        errorMessage = QString("Config key '%1' must be a positive number").arg(key);
        return false;
    }
    out = value.toDouble();
    return true;
}

bool readPositiveInt(const QJsonObject& json, const QString& key, int& out, QString& errorMessage) {
    if (!json.contains(key)) {
        return true;
    }
    const QJsonValue value = json.value(key);
    const double number = value.toDouble();
    if (!value.isDouble() || number < 1.0 || std::floor(number) != number ||
        number > static_cast<double>(std::numeric_limits<int>::max())) {
        errorMessage = QString("Config key '%1' must be a positive integer no larger than %2")
                           .arg(key)
                           .arg(std::numeric_limits<int>::max());
        return false;
    }
    out = static_cast<int>(number);
    return true;
}

bool readBool(const QJsonObject& json, const QString& key, bool& out, QString& errorMessage) {
    if (!json.contains(key)) {
        return true;
    }
    const QJsonValue value = json.value(key);
    if (!value.isBool()) {
        errorMessage = QString("Config key '%1' must be a boolean").arg(key);
        return false;
    }
    out = value.toBool();
    return true;
}

QJsonArray serializePolygon(const Polygon2D& polygon) {
    QJsonArray array;
    for (const auto& point : polygon) {
        array.append(SpaceJson::serializePoint(point));
    }
    return array;
}

} // namespace

bool SpaceJson::loadWallFile(const QString& path, WallFile& wallFile, QString& errorMessage) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        errorMessage = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    const QByteArray data = file.readAll();
    if (!parseWallDocument(data, wallFile, errorMessage)) {
        errorMessage = QString("%1: %2").arg(path, errorMessage);
        return false;
    }

    qCDebug(logSpaceJson) << "loadWallFile:done" << "path=" << path << "walls=" << wallFile.walls.size();
    return true;
}

bool SpaceJson::parseWallDocument(const QByteArray& data, WallFile& wallFile, QString& errorMessage) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        errorMessage = QString("Invalid JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        errorMessage = QStringLiteral("Top level must be an object");
        return false;
    }

    const QJsonObject root = doc.object();
    if (!root.value("walls").isArray()) {
        errorMessage = QStringLiteral("Missing 'walls' array");
        return false;
    }

    WallFile result;
    const QJsonArray walls = root.value("walls").toArray();
    result.walls.reserve(static_cast<size_t>(walls.size()));
    for (qsizetype i = 0; i < walls.size(); ++i) {
        if (!walls.at(i).isObject()) {
            errorMessage = QString("Wall %1 is not an object").arg(i);
            return false;
        }
        QString wallError;
        auto wall = deserializeWall(walls.at(i).toObject(), wallError);
        if (!wall) {
            errorMessage = QString("Wall %1: %2").arg(i).arg(wallError);
            return false;
        }
        result.walls.push_back(std::move(*wall));
    }

    if (root.contains("config")) {
        if (!root.value("config").isObject()) {
            errorMessage = QStringLiteral("'config' must be an object");
            return false;
        }
        if (!applyConfig(root.value("config").toObject(), result.config, errorMessage)) {
            return false;
        }
    }

    wallFile = std::move(result);
    return true;
}

std::optional<WallSegment> SpaceJson::deserializeWall(const QJsonObject& json, QString& errorMessage) {
    if (!json.value("id").isString() || json.value("id").toString().isEmpty()) {
        errorMessage = QStringLiteral("missing 'id' string");
        return std::nullopt;
    }
    auto start = deserializePoint(json.value("start"));
    if (!start) {
        errorMessage = QStringLiteral("malformed 'start' point");
        return std::nullopt;
    }
    auto end = deserializePoint(json.value("end"));
    if (!end) {
        errorMessage = QStringLiteral("malformed 'end' point");
        return std::nullopt;
    }

    WallSegment wall;
    wall.id = json.value("id").toString().toStdString();
    wall.start = *start;
    wall.end = *end;
    return wall;
}

std::optional<Point2D> SpaceJson::deserializePoint(const QJsonValue& value) {
    if (value.isArray()) {
        const QJsonArray array = value.toArray();
        if (array.size() != 2 || !array.at(0).isDouble() || !array.at(1).isDouble()) {
            return std::nullopt;
        }
        return Point2D{array.at(0).toDouble(), array.at(1).toDouble()};
    }
    if (value.isObject()) {
        const QJsonObject object = value.toObject();
        if (!object.value("x").isDouble() || !object.value("y").isDouble()) {
            return std::nullopt;
        }
        return Point2D{object.value("x").toDouble(), object.value("y").toDouble()};
    }
    return std::nullopt;
}

bool SpaceJson::applyConfig(const QJsonObject& json, SpaceDetectorConfig& config, QString& errorMessage) {
    SpaceDetectorConfig updated = config;
    if (!readPositiveDouble(json, "tolerance", updated.mergeTolerance, errorMessage) ||
        !readPositiveDouble(json, "minArea", updated.minSpaceArea, errorMessage) ||
        !readPositiveInt(json, "rayCount", updated.rayCount, errorMessage) ||
        !readPositiveDouble(json, "maxRayLength", updated.maxRayLength, errorMessage) ||
        !readPositiveDouble(json, "rayHitMergeDistance", updated.rayHitMergeDistance, errorMessage) ||
        !readPositiveDouble(json, "collinearTolerance", updated.collinearTolerance, errorMessage) ||
        !readPositiveInt(json, "maxTraceSteps", updated.maxTraceSteps, errorMessage) ||
        !readBool(json, "pruneFilaments", updated.pruneFilaments, errorMessage) ||
        !readBool(json, "requireFullEnclosure", updated.requireFullEnclosure, errorMessage) ||
        !readBool(json, "orientCounterClockwise", updated.orientCounterClockwise, errorMessage)) {
        return false;
    }
    config = updated;
    return true;
}

QJsonArray SpaceJson::serializePoint(const Point2D& point) {
    return QJsonArray{point.x, point.y};
}

QJsonObject SpaceJson::serializeWall(const WallSegment& wall) {
    QJsonObject json;
    json["id"] = QString::fromStdString(wall.id);
    json["start"] = serializePoint(wall.start);
    json["end"] = serializePoint(wall.end);
    return json;
}

QJsonObject SpaceJson::serializeConfig(const SpaceDetectorConfig& config) {
    QJsonObject json;
    json["tolerance"] = config.mergeTolerance;
    json["minArea"] = config.minSpaceArea;
    json["rayCount"] = config.rayCount;
    json["maxRayLength"] = config.maxRayLength;
    json["rayHitMergeDistance"] = config.rayHitMergeDistance;
    json["collinearTolerance"] = config.collinearTolerance;
    json["maxTraceSteps"] = config.maxTraceSteps;
    json["pruneFilaments"] = config.pruneFilaments;
    json["requireFullEnclosure"] = config.requireFullEnclosure;
    json["orientCounterClockwise"] = config.orientCounterClockwise;
    return json;
}

QJsonObject SpaceJson::serializeSpace(const DetectedSpace& space) {
    QJsonArray wallIds;
    for (const auto& id : space.boundingWallIds) {
        wallIds.append(QString::fromStdString(id));
    }

    QJsonObject json;
    json["boundary"] = serializePolygon(space.boundaryPolygon);
    json["wallIds"] = wallIds;
    json["area"] = space.area;
    json["perimeter"] = space.perimeter;
    json["centroid"] = serializePoint(space.centroid);
    return json;
}

QByteArray SpaceJson::serializeWallFile(const WallFile& wallFile) {
    QJsonArray walls;
    for (const auto& wall : wallFile.walls) {
        walls.append(serializeWall(wall));
    }

    QJsonObject root;
    root["walls"] = walls;
    root["config"] = serializeConfig(wallFile.config);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

QByteArray SpaceJson::serializeSpaces(const std::vector<DetectedSpace>& spaces) {
    QJsonArray array;
    for (const auto& space : spaces) {
        array.append(serializeSpace(space));
    }

    QJsonObject root;
    root["spaces"] = array;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

QByteArray SpaceJson::serializeSpaceQuery(const std::optional<DetectedSpace>& space) {
    QJsonObject root;
    root["space"] = space ? QJsonValue(serializeSpace(*space)) : QJsonValue(QJsonValue::Null);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

bool SpaceJson::writeFile(const QString& path, const QByteArray& data, QString& errorMessage) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        errorMessage = QString("Cannot open %1 for writing: %2").arg(path, file.errorString());
        return false;
    }
    if (file.write(data) != data.size()) {
        errorMessage = QString("Failed to write %1: %2").arg(path, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        errorMessage = QString("Failed to commit %1: %2").arg(path, file.errorString());
        return false;
    }

    qCDebug(logSpaceJson) << "writeFile:done" << "path=" << path << "bytes=" << data.size();
    return true;
}

} // namespace roomtrace::io
