#include "RayCastDetector.h"
#include "PolygonMath.h"
#include "SpaceAssembler.h"

#include <Eigen/Dense>

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <unordered_set>

namespace roomtrace::core::space {

Q_LOGGING_CATEGORY(logRayCast, "roomtrace.core.space.raycast")

RayCastDetector::RayCastDetector()
    : config_() {
}

RayCastDetector::RayCastDetector(const RayCastConfig& config)
    : config_(config) {
}

std::optional<RayHit> RayCastDetector::intersectRay(const Point2D& origin,
                                                    const Point2D& direction,
                                                    const WallSegment& wall,
                                                    double maxDistance) {
    const Eigen::Vector2d d(direction.x, direction.y);
    const Eigen::Vector2d e(wall.end.x - wall.start.x, wall.end.y - wall.start.y);

    // origin + t*d = start + s*e  =>  [d  -e] * (t, s) = start - origin
    Eigen::Matrix2d system;
    system.col(0) = d;
    system.col(1) = -e;
    const double det = system.determinant();
    if (std::abs(det) < constants::PARALLEL_EPSILON) {
        return std::nullopt;
    }

    const Eigen::Vector2d rhs(wall.start.x - origin.x, wall.start.y - origin.y);
    const Eigen::Vector2d ts = system.inverse() * rhs;
    const double t = ts.x();
    const double s = ts.y();

    if (t <= constants::MIN_RAY_DISTANCE || s < 0.0 || s > 1.0 || t > maxDistance) {
        return std::nullopt;
    }

    RayHit hit;
    hit.point = {origin.x + t * direction.x, origin.y + t * direction.y};
    hit.wallId = wall.id;
    hit.distance = t;
    hit.angle = std::atan2(direction.y, direction.x);
    if (hit.angle < 0.0) {
        hit.angle += 2.0 * std::numbers::pi_v<double>;
    }
    return hit;
}

std::vector<RayHit> RayCastDetector::castRays(const Point2D& origin,
                                              const std::vector<WallSegment>& walls,
                                              int& missedRays) const {
    std::vector<RayHit> hits;
    hits.reserve(static_cast<size_t>(std::max(config_.rayCount, 0)));
    missedRays = 0;

    for (int i = 0; i < config_.rayCount; ++i) {
        const double angle = 2.0 * std::numbers::pi_v<double> * i / config_.rayCount;
        const Point2D direction{std::cos(angle), std::sin(angle)};

        std::optional<RayHit> closest;
        for (const auto& wall : walls) {
            auto hit = intersectRay(origin, direction, wall, config_.maxRayLength);
            if (hit && (!closest || hit->distance < closest->distance)) {
                closest = std::move(hit);
            }
        }

        if (!closest) {
            ++missedRays;
            continue;
        }
        closest->angle = angle;
        hits.push_back(std::move(*closest));
    }
    return hits;
}

std::vector<RayHit> RayCastDetector::mergeNearbyHits(std::vector<RayHit> hits) const {
    std::stable_sort(hits.begin(), hits.end(), [](const RayHit& a, const RayHit& b) {
        return a.angle < b.angle;
    });

    std::vector<RayHit> merged;
    merged.reserve(hits.size());
    for (auto& hit : hits) {
        if (!merged.empty() &&
            pointDistance(merged.back().point, hit.point) < config_.mergeDistance) {
            continue;
        }
        merged.push_back(std::move(hit));
    }

    // The sweep wraps around: the last hit may land on the first.
    if (merged.size() > 1 &&
        pointDistance(merged.back().point, merged.front().point) < config_.mergeDistance) {
        merged.pop_back();
    }
    return merged;
}

std::vector<RayHit> RayCastDetector::removeCollinearHits(const std::vector<RayHit>& hits) const {
    if (hits.size() <= 3) {
        return hits;
    }

    std::vector<RayHit> kept;
    const size_t n = hits.size();
    for (size_t i = 0; i < n; ++i) {
        const RayHit& prev = hits[(i + n - 1) % n];
        const RayHit& next = hits[(i + 1) % n];
        // Neighbours are taken from the unfiltered list, so a long straight
        // run drops every interior hit in one pass.
        if (distanceToLine(hits[i].point, prev.point, next.point) > config_.collinearTolerance) {
            kept.push_back(hits[i]);
        }
    }

    if (kept.size() < 3) {
        return std::vector<RayHit>(hits.begin(), hits.begin() + 3);
    }
    return kept;
}

std::optional<RayCastBoundary> RayCastDetector::traceBoundary(
    const Point2D& origin, const std::vector<WallSegment>& walls) const {
    int missedRays = 0;
    std::vector<RayHit> hits = castRays(origin, walls, missedRays);

    if (config_.requireFullEnclosure && missedRays > 0) {
        qCDebug(logRayCast) << "reject:open-region" << "missedRays=" << missedRays;
        return std::nullopt;
    }
    if (hits.size() < 3) {
        qCDebug(logRayCast) << "reject:too-few-hits" << "hits=" << hits.size();
        return std::nullopt;
    }

    hits = mergeNearbyHits(std::move(hits));
    if (hits.size() < 3) {
        qCDebug(logRayCast) << "reject:collapsed-after-merge" << "hits=" << hits.size();
        return std::nullopt;
    }
    hits = removeCollinearHits(hits);

    RayCastBoundary boundary;
    boundary.missedRays = missedRays;
    boundary.polygon.reserve(hits.size());
    std::unordered_set<WallID> seenWalls;
    for (const auto& hit : hits) {
        boundary.polygon.push_back(hit.point);
        if (seenWalls.insert(hit.wallId).second) {
            boundary.wallIds.push_back(hit.wallId);
        }
    }

    const double area = polygonArea(boundary.polygon);
    if (area < config_.minArea) {
        qCDebug(logRayCast) << "reject:below-min-area" << "area=" << area;
        return std::nullopt;
    }

    qCDebug(logRayCast) << "boundary-traced"
                        << "vertices=" << boundary.polygon.size()
                        << "walls=" << boundary.wallIds.size()
                        << "missedRays=" << missedRays
                        << "area=" << area;
    return boundary;
}

std::optional<DetectedSpace> RayCastDetector::detect(const Point2D& origin,
                                                     const std::vector<WallSegment>& walls) const {
    auto boundary = traceBoundary(origin, walls);
    if (!boundary) {
        return std::nullopt;
    }
    return assembleSpace(boundary->polygon, boundary->wallIds, config_.minArea);
}

} // namespace roomtrace::core::space
