/**
 * @file RayCastDetector.h
 * @brief Point-query space detection by angular ray casting
 *
 * Works on raw wall segments rather than the wall graph, so it tolerates
 * walls whose endpoints do not quite meet: from the query point, a fan of
 * rays finds the nearest wall in every direction and the hit points,
 * already in angular order, become the boundary polygon once near
 * duplicates and collinear runs are thinned out.
 */

#ifndef ROOMTRACE_CORE_SPACE_RAY_CAST_DETECTOR_H
#define ROOMTRACE_CORE_SPACE_RAY_CAST_DETECTOR_H

#include "SpaceTypes.h"

#include <optional>
#include <vector>

namespace roomtrace::core::space {

/**
 * @brief Nearest wall hit along one ray
 */
struct RayHit {
    Point2D point;
    WallID wallId;

    /// Distance from the ray origin (m)
    double distance = 0.0;

    /// Ray angle in radians, [0, 2π)
    double angle = 0.0;
};

/**
 * @brief Simplified boundary around a query point
 */
struct RayCastBoundary {
    Polygon2D polygon;

    /// Distinct walls the surviving hits lie on, first-seen order
    std::vector<WallID> wallIds;

    /// Rays that found no wall
    int missedRays = 0;
};

/**
 * @brief Configuration for ray casting
 */
struct RayCastConfig {
    int rayCount = constants::RAY_COUNT;
    double maxRayLength = constants::MAX_RAY_LENGTH;

    /// Consecutive hits closer than this collapse into the earlier one (m)
    double mergeDistance = constants::RAY_HIT_MERGE_DISTANCE;

    /// Hits this close to the line through their neighbours are dropped (m)
    double collinearTolerance = constants::COLLINEAR_TOLERANCE;

    /// Boundaries enclosing less than this are rejected (m²)
    double minArea = constants::MIN_SPACE_AREA;

    /// Reject the query if any ray escapes without hitting a wall
    bool requireFullEnclosure = false;
};

/**
 * @brief Finds the region around a point by casting rays against walls
 */
class RayCastDetector {
public:
    RayCastDetector();
    explicit RayCastDetector(const RayCastConfig& config);

    /**
     * @brief Detect the space containing @p origin
     * @return std::nullopt if no enclosing boundary of sufficient area exists
     */
    std::optional<DetectedSpace> detect(const Point2D& origin,
                                        const std::vector<WallSegment>& walls) const;

    /**
     * @brief Cast, merge and simplify, without building a DetectedSpace
     * @return std::nullopt if fewer than 3 rays hit, the enclosure check
     *         fails, or the simplified polygon is below the minimum area
     */
    std::optional<RayCastBoundary> traceBoundary(const Point2D& origin,
                                                 const std::vector<WallSegment>& walls) const;

    /**
     * @brief Parametric ray/segment intersection
     * @param direction Unit ray direction
     * @return Hit in front of the origin (beyond 1 mm), on the segment and
     *         within @p maxDistance; std::nullopt when the ray is parallel
     *         to the segment or misses it
     */
    static std::optional<RayHit> intersectRay(const Point2D& origin,
                                              const Point2D& direction,
                                              const WallSegment& wall,
                                              double maxDistance);

    void setConfig(const RayCastConfig& config) { config_ = config; }
    const RayCastConfig& getConfig() const { return config_; }

private:
    std::vector<RayHit> castRays(const Point2D& origin,
                                 const std::vector<WallSegment>& walls,
                                 int& missedRays) const;
    std::vector<RayHit> mergeNearbyHits(std::vector<RayHit> hits) const;
    std::vector<RayHit> removeCollinearHits(const std::vector<RayHit>& hits) const;

    RayCastConfig config_;
};

} // namespace roomtrace::core::space

#endif // ROOMTRACE_CORE_SPACE_RAY_CAST_DETECTOR_H
