#include "SpaceAssembler.h"
#include "PolygonMath.h"

#include <algorithm>

namespace roomtrace::core::space {

namespace {

std::vector<WallID> distinctSorted(const std::vector<WallID>& ids) {
    std::vector<WallID> sorted = ids;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    return sorted;
}

DetectedSpace makeSpace(const Polygon2D& polygon, const std::vector<WallID>& wallIds) {
    DetectedSpace space;
    space.boundaryPolygon = polygon;
    space.boundingWallIds = wallIds;
    space.area = polygonArea(polygon);
    space.perimeter = polygonPerimeter(polygon);
    space.centroid = vertexCentroid(polygon);
    return space;
}

} // namespace

std::optional<DetectedSpace> assembleSpace(const Polygon2D& polygon,
                                           const std::vector<WallID>& wallIds,
                                           double minArea) {
    if (polygon.size() < 3) {
        return std::nullopt;
    }
    if (polygonArea(polygon) < minArea) {
        return std::nullopt;
    }
    return makeSpace(polygon, wallIds);
}

std::optional<DetectedSpace> spaceFromPolygon(const Polygon2D& polygon,
                                              const std::vector<WallID>& wallIds) {
    if (polygon.size() < 3) {
        return std::nullopt;
    }
    return makeSpace(ensureCounterClockwise(polygon), wallIds);
}

bool sameBoundingWalls(const DetectedSpace& a, const DetectedSpace& b) {
    return distinctSorted(a.boundingWallIds) == distinctSorted(b.boundingWallIds);
}

std::optional<size_t> findSpaceWithSameWalls(const std::vector<DetectedSpace>& spaces,
                                             const DetectedSpace& candidate) {
    for (size_t i = 0; i < spaces.size(); ++i) {
        if (sameBoundingWalls(spaces[i], candidate)) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace roomtrace::core::space
