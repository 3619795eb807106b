/**
 * @file SpaceTypes.h
 * @brief Core value types for the space detection engine
 *
 * Walls come in as plain segments tagged with an external ID and leave as
 * DetectedSpace records. Nothing here has identity of its own; all values
 * are created per detection call and handed back to the caller.
 */

#ifndef ROOMTRACE_CORE_SPACE_TYPES_H
#define ROOMTRACE_CORE_SPACE_TYPES_H

#include <string>
#include <vector>

namespace roomtrace::core::space {

//==============================================================================
// Type Aliases
//==============================================================================

/**
 * @brief Wall identifier - owned by the caller, opaque to the engine
 */
using WallID = std::string;

//==============================================================================
// Basic Geometry Types
//==============================================================================

/**
 * @brief Simple 2D point in plan coordinates (metres)
 */
struct Point2D {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Point2D& a, const Point2D& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point2D& a, const Point2D& b) {
    return !(a == b);
}

using Polygon2D = std::vector<Point2D>;

/**
 * @brief Input wall: a straight segment between two plan points
 */
struct WallSegment {
    WallID id;
    Point2D start;
    Point2D end;
};

/**
 * @brief A closed region found by one of the detectors
 *
 * Handed to the space element factory, which adds identity, storey
 * association and property sets.
 */
struct DetectedSpace {
    /// Closed boundary in traversal order (first vertex not repeated)
    Polygon2D boundaryPolygon;

    /// Walls bounding this space
    std::vector<WallID> boundingWallIds;

    /// Floor area in m²
    double area = 0.0;

    /// Boundary length in m
    double perimeter = 0.0;

    /// Vertex-average centre, used for label placement only
    Point2D centroid;
};

//==============================================================================
// Constants
//==============================================================================

namespace constants {

/// Endpoint merge radius (m)
constexpr double MERGE_TOLERANCE = 0.05;

/// Smallest area accepted as a room (m²)
constexpr double MIN_SPACE_AREA = 0.5;

/// Rays cast by the point query (1° spacing)
constexpr int RAY_COUNT = 360;

/// Rays stop looking for walls beyond this distance (m)
constexpr double MAX_RAY_LENGTH = 1000.0;

/// Hit points closer than this are merged (m)
constexpr double RAY_HIT_MERGE_DISTANCE = 0.05;

/// Hit points deviating less than this from their neighbours are dropped (m)
constexpr double COLLINEAR_TOLERANCE = 0.02;

/// Boundary tracing gives up after this many steps
constexpr int MAX_TRACE_STEPS = 100;

/// Ray/segment determinant below which the two are treated as parallel
constexpr double PARALLEL_EPSILON = 1e-10;

/// Ray hits nearer than this to the origin are ignored (m)
constexpr double MIN_RAY_DISTANCE = 0.001;

} // namespace constants

} // namespace roomtrace::core::space

#endif // ROOMTRACE_CORE_SPACE_TYPES_H
