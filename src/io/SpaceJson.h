/**
 * @file SpaceJson.h
 * @brief JSON reading of wall layouts and writing of detected spaces
 */

#pragma once

#include "../core/space/SpaceDetector.h"
#include "../core/space/SpaceTypes.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>
#include <vector>

namespace roomtrace::io {

/**
 * @brief Contents of a wall file
 */
struct WallFile {
    std::vector<core::space::WallSegment> walls;
    core::space::SpaceDetectorConfig config;
};

/**
 * @brief Serialization for wall files and detection results
 *
 * Wall file:
 *   { "walls": [ {"id": "w1", "start": [0, 0], "end": [4, 0]}, ... ],
 *     "config": { "tolerance": 0.05, ... } }
 *
 * Points are [x, y] arrays or {"x": .., "y": ..} objects. The config object
 * is optional and unknown keys in it are ignored.
 */
class SpaceJson {
public:
    /**
     * @brief Read and parse a wall file from disk
     */
    static bool loadWallFile(const QString& path, WallFile& wallFile, QString& errorMessage);

    /**
     * @brief Parse wall file contents
     */
    static bool parseWallDocument(const QByteArray& data, WallFile& wallFile, QString& errorMessage);

    /**
     * @brief Deserialize one wall entry
     */
    static std::optional<core::space::WallSegment> deserializeWall(const QJsonObject& json,
                                                                   QString& errorMessage);

    /**
     * @brief Apply the keys present in a config object on top of @p config
     */
    static bool applyConfig(const QJsonObject& json,
                            core::space::SpaceDetectorConfig& config,
                            QString& errorMessage);

    static std::optional<core::space::Point2D> deserializePoint(const QJsonValue& value);

    static QJsonArray serializePoint(const core::space::Point2D& point);
    static QJsonObject serializeWall(const core::space::WallSegment& wall);
    static QJsonObject serializeConfig(const core::space::SpaceDetectorConfig& config);
    static QJsonObject serializeSpace(const core::space::DetectedSpace& space);

    /**
     * @brief Wall file document, readable by parseWallDocument()
     */
    static QByteArray serializeWallFile(const WallFile& wallFile);

    /**
     * @brief {"spaces": [...]} document
     */
    static QByteArray serializeSpaces(const std::vector<core::space::DetectedSpace>& spaces);

    /**
     * @brief {"space": {...} | null} document for a point query
     */
    static QByteArray serializeSpaceQuery(const std::optional<core::space::DetectedSpace>& space);

    static bool writeFile(const QString& path, const QByteArray& data, QString& errorMessage);

private:
    SpaceJson() = delete;
};

} // namespace roomtrace::io
