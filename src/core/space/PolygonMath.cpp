#include "PolygonMath.h"

#include <gp_Dir2d.hxx>
#include <gp_Lin2d.hxx>
#include <gp_Vec2d.hxx>

#include <cmath>

namespace roomtrace::core::space {

namespace {
constexpr double kMinCentroidArea = 1e-9;
constexpr double kDegenerateLineLength = 1e-10;
} // namespace

double pointDistance(const Point2D& a, const Point2D& b) {
    return toGpPnt(a).Distance(toGpPnt(b));
}

double signedArea(const Polygon2D& polygon) {
    if (polygon.size() < 3) {
        return 0.0;
    }
    double area = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const auto& p1 = polygon[i];
        const auto& p2 = polygon[(i + 1) % polygon.size()];
        area += p1.x * p2.y - p2.x * p1.y;
    }
    return 0.5 * area;
}

double polygonArea(const Polygon2D& polygon) {
    return std::abs(signedArea(polygon));
}

double polygonPerimeter(const Polygon2D& polygon) {
    if (polygon.size() < 2) {
        return 0.0;
    }
    double perimeter = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        perimeter += pointDistance(polygon[i], polygon[(i + 1) % polygon.size()]);
    }
    return perimeter;
}

Point2D vertexCentroid(const Polygon2D& polygon) {
    Point2D centroid{0.0, 0.0};
    if (polygon.empty()) {
        return centroid;
    }
    for (const auto& p : polygon) {
        centroid.x += p.x;
        centroid.y += p.y;
    }
    centroid.x /= static_cast<double>(polygon.size());
    centroid.y /= static_cast<double>(polygon.size());
    return centroid;
}

Point2D areaCentroid(const Polygon2D& polygon) {
    if (std::abs(signedArea(polygon)) < kMinCentroidArea) {
        return vertexCentroid(polygon);
    }

    Point2D centroid{0.0, 0.0};
    double factor = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const auto& p1 = polygon[i];
        const auto& p2 = polygon[(i + 1) % polygon.size()];
        double cross = p1.x * p2.y - p2.x * p1.y;
        centroid.x += (p1.x + p2.x) * cross;
        centroid.y += (p1.y + p2.y) * cross;
        factor += cross;
    }

    factor = 1.0 / (3.0 * factor);
    centroid.x *= factor;
    centroid.y *= factor;
    return centroid;
}

bool isPointInPolygon(const Point2D& point, const Polygon2D& polygon) {
    if (polygon.size() < 3) {
        return false;
    }
    bool inside = false;
    for (size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++) {
        const auto& pi = polygon[i];
        const auto& pj = polygon[j];
        bool intersect = ((pi.y > point.y) != (pj.y > point.y)) &&
                         (point.x < (pj.x - pi.x) * (point.y - pi.y) / (pj.y - pi.y) + pi.x);
        if (intersect) {
            inside = !inside;
        }
    }
    return inside;
}

Polygon2D ensureCounterClockwise(const Polygon2D& polygon) {
    if (signedArea(polygon) >= 0.0) {
        return polygon;
    }
    Polygon2D reversed(polygon.rbegin(), polygon.rend());
    return reversed;
}

double distanceToLine(const Point2D& point, const Point2D& a, const Point2D& b) {
    const gp_Pnt2d start = toGpPnt(a);
    const gp_Pnt2d end = toGpPnt(b);
    if (start.Distance(end) < kDegenerateLineLength) {
        return start.Distance(toGpPnt(point));
    }
    const gp_Lin2d line(start, gp_Dir2d(gp_Vec2d(start, end)));
    return line.Distance(toGpPnt(point));
}

} // namespace roomtrace::core::space
