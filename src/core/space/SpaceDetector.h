/**
 * @file SpaceDetector.h
 * @brief Entry points for room detection from wall layouts
 *
 * Two paths share one configuration:
 *   - detectSpaces(): every enclosed room, via the wall graph and
 *     minimal cycle extraction
 *   - detectSpaceAtPoint(): the room around one point, via ray casting
 *     against the raw walls
 *
 * Both are pure: nothing is cached between calls.
 */

#ifndef ROOMTRACE_CORE_SPACE_SPACE_DETECTOR_H
#define ROOMTRACE_CORE_SPACE_SPACE_DETECTOR_H

#include "CycleDetector.h"
#include "RayCastDetector.h"
#include "SpaceTypes.h"
#include "WallGraph.h"

#include <optional>
#include <vector>

namespace roomtrace::core::space {

/**
 * @brief Tuning for both detection paths
 */
struct SpaceDetectorConfig {
    double mergeTolerance = constants::MERGE_TOLERANCE;
    double minSpaceArea = constants::MIN_SPACE_AREA;
    int rayCount = constants::RAY_COUNT;
    double maxRayLength = constants::MAX_RAY_LENGTH;
    double rayHitMergeDistance = constants::RAY_HIT_MERGE_DISTANCE;
    double collinearTolerance = constants::COLLINEAR_TOLERANCE;
    int maxTraceSteps = constants::MAX_TRACE_STEPS;

    /// Detach dangling walls before cycle extraction
    bool pruneFilaments = true;

    /// Point queries fail when any ray escapes
    bool requireFullEnclosure = false;

    /// Normalize every returned boundary to counter-clockwise
    bool orientCounterClockwise = false;

    CycleDetectorConfig cycleConfig() const;
    RayCastConfig rayCastConfig() const;
};

class SpaceDetector {
public:
    SpaceDetector();
    explicit SpaceDetector(const SpaceDetectorConfig& config);

    /**
     * @brief Detect all enclosed rooms
     * @return Rooms ordered by area, largest first; empty for <3 walls
     */
    std::vector<DetectedSpace> detectSpaces(const std::vector<WallSegment>& walls) const;

    /**
     * @brief Detect the room containing @p point
     * @return std::nullopt for <3 walls or when no boundary is found
     */
    std::optional<DetectedSpace> detectSpaceAtPoint(const Point2D& point,
                                                    const std::vector<WallSegment>& walls) const;

    void setConfig(const SpaceDetectorConfig& config) { config_ = config; }
    const SpaceDetectorConfig& getConfig() const { return config_; }

private:
    DetectedSpace finish(DetectedSpace space) const;

    SpaceDetectorConfig config_;
};

/**
 * @brief detectSpaces() with default settings and the given merge tolerance
 */
std::vector<DetectedSpace> detectSpaces(const std::vector<WallSegment>& walls,
                                        double tolerance = constants::MERGE_TOLERANCE);

/**
 * @brief detectSpaceAtPoint() with default settings
 */
std::optional<DetectedSpace> detectSpaceAtPoint(const Point2D& point,
                                                const std::vector<WallSegment>& walls);

} // namespace roomtrace::core::space

#endif // ROOMTRACE_CORE_SPACE_SPACE_DETECTOR_H
