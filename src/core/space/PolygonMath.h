/**
 * @file PolygonMath.h
 * @brief Stateless polygon primitives shared by both space detectors
 *
 * Polygons are implicit-closed vertex lists: the last vertex connects back
 * to the first and is not repeated.
 */

#ifndef ROOMTRACE_CORE_SPACE_POLYGON_MATH_H
#define ROOMTRACE_CORE_SPACE_POLYGON_MATH_H

#include "SpaceTypes.h"

#include <gp_Pnt2d.hxx>

namespace roomtrace::core::space {

/**
 * @brief Convert to an OCCT point
 */
inline gp_Pnt2d toGpPnt(const Point2D& p) {
    return gp_Pnt2d(p.x, p.y);
}

/**
 * @brief Convert from an OCCT point
 */
inline Point2D toPoint2D(const gp_Pnt2d& p) {
    return {p.X(), p.Y()};
}

/**
 * @brief Euclidean distance between two points
 */
double pointDistance(const Point2D& a, const Point2D& b);

/**
 * @brief Signed shoelace area
 * @return Positive for counter-clockwise, negative for clockwise, 0 for <3 points
 */
double signedArea(const Polygon2D& polygon);

/**
 * @brief Absolute polygon area, 0 for <3 points
 */
double polygonArea(const Polygon2D& polygon);

/**
 * @brief Closed boundary length, 0 for <2 points
 */
double polygonPerimeter(const Polygon2D& polygon);

/**
 * @brief Arithmetic mean of the vertices
 *
 * Not a centre of mass: vertices crowd toward detailed parts of the outline
 * and pull the result with them. Only used to place room labels. Returns
 * (0, 0) for an empty polygon.
 */
Point2D vertexCentroid(const Polygon2D& polygon);

/**
 * @brief Area-weighted centroid (centre of mass of the enclosed region)
 *
 * Falls back to vertexCentroid() when the polygon has (near) zero area.
 */
Point2D areaCentroid(const Polygon2D& polygon);

/**
 * @brief Even-odd crossing test against a horizontal ray
 * @return false for <3 points
 */
bool isPointInPolygon(const Point2D& point, const Polygon2D& polygon);

/**
 * @brief Return the polygon in counter-clockwise order
 *
 * Reverses clockwise input; anything else (including <3 points) comes back
 * unchanged. Idempotent.
 */
Polygon2D ensureCounterClockwise(const Polygon2D& polygon);

/**
 * @brief Perpendicular distance from a point to the infinite line a-b
 *
 * Degenerates to the distance to @p a when a and b coincide.
 */
double distanceToLine(const Point2D& point, const Point2D& a, const Point2D& b);

} // namespace roomtrace::core::space

#endif // ROOMTRACE_CORE_SPACE_POLYGON_MATH_H
