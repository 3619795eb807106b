#include "SpaceDetector.h"
#include "PolygonMath.h"
#include "SpaceAssembler.h"

#include <QLoggingCategory>

#include <utility>

namespace roomtrace::core::space {

Q_LOGGING_CATEGORY(logSpaceDetector, "roomtrace.core.space.detector")

namespace {
constexpr size_t kMinWallCount = 3;
} // namespace

CycleDetectorConfig SpaceDetectorConfig::cycleConfig() const {
    CycleDetectorConfig config;
    config.minArea = minSpaceArea;
    config.maxTraceSteps = maxTraceSteps;
    return config;
}

RayCastConfig SpaceDetectorConfig::rayCastConfig() const {
    RayCastConfig config;
    config.rayCount = rayCount;
    config.maxRayLength = maxRayLength;
    config.mergeDistance = rayHitMergeDistance;
    config.collinearTolerance = collinearTolerance;
    config.minArea = minSpaceArea;
    config.requireFullEnclosure = requireFullEnclosure;
    return config;
}

SpaceDetector::SpaceDetector()
    : config_() {
}

SpaceDetector::SpaceDetector(const SpaceDetectorConfig& config)
    : config_(config) {
}

std::vector<DetectedSpace> SpaceDetector::detectSpaces(const std::vector<WallSegment>& walls) const {
    std::vector<DetectedSpace> spaces;
    if (walls.size() < kMinWallCount) {
        qCDebug(logSpaceDetector) << "detectSpaces:too-few-walls" << "walls=" << walls.size();
        return spaces;
    }

    WallGraphBuilder builder(config_.mergeTolerance);
    const WallGraph graph = builder.build(walls, config_.pruneFilaments);

    MinimalCycleDetector cycleDetector(config_.cycleConfig());
    const std::vector<Cycle> cycles = cycleDetector.findCycles(graph);

    spaces.reserve(cycles.size());
    for (const auto& cycle : cycles) {
        auto space = assembleSpace(cycle.points, cycle.wallIds, config_.minSpaceArea);
        if (space) {
            spaces.push_back(finish(std::move(*space)));
        }
    }

    qCInfo(logSpaceDetector) << "detectSpaces:done"
                             << "walls=" << walls.size()
                             << "spaces=" << spaces.size();
    return spaces;
}

std::optional<DetectedSpace> SpaceDetector::detectSpaceAtPoint(
    const Point2D& point, const std::vector<WallSegment>& walls) const {
    if (walls.size() < kMinWallCount) {
        qCDebug(logSpaceDetector) << "detectSpaceAtPoint:too-few-walls" << "walls=" << walls.size();
        return std::nullopt;
    }

    // Walls the graph builder would skip are not boundaries here either.
    WallGraphBuilder builder(config_.mergeTolerance);
    const std::vector<WallSegment> usable = builder.usableWalls(walls);
    if (builder.stats().degenerateWalls > 0) {
        qCDebug(logSpaceDetector) << "detectSpaceAtPoint:skip-degenerate"
                                  << "count=" << builder.stats().degenerateWalls;
    }

    RayCastDetector rayCaster(config_.rayCastConfig());
    auto space = rayCaster.detect(point, usable);
    if (!space) {
        qCInfo(logSpaceDetector) << "detectSpaceAtPoint:no-space"
                                 << "x=" << point.x << "y=" << point.y;
        return std::nullopt;
    }

    qCInfo(logSpaceDetector) << "detectSpaceAtPoint:done"
                             << "x=" << point.x << "y=" << point.y
                             << "area=" << space->area
                             << "walls=" << space->boundingWallIds.size();
    return finish(std::move(*space));
}

DetectedSpace SpaceDetector::finish(DetectedSpace space) const {
    if (config_.orientCounterClockwise) {
        space.boundaryPolygon = ensureCounterClockwise(space.boundaryPolygon);
    }
    return space;
}

std::vector<DetectedSpace> detectSpaces(const std::vector<WallSegment>& walls, double tolerance) {
    SpaceDetectorConfig config;
    config.mergeTolerance = tolerance;
    return SpaceDetector(config).detectSpaces(walls);
}

std::optional<DetectedSpace> detectSpaceAtPoint(const Point2D& point,
                                                const std::vector<WallSegment>& walls) {
    return SpaceDetector().detectSpaceAtPoint(point, walls);
}

} // namespace roomtrace::core::space
