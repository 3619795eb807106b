/**
 * @file SpaceAssembler.h
 * @brief Turns a closed outline plus its walls into a DetectedSpace
 *
 * Both detectors finish here, so a room comes out with the same area,
 * perimeter and centroid no matter which path found it.
 */

#ifndef ROOMTRACE_CORE_SPACE_SPACE_ASSEMBLER_H
#define ROOMTRACE_CORE_SPACE_SPACE_ASSEMBLER_H

#include "SpaceTypes.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace roomtrace::core::space {

/**
 * @brief Build a DetectedSpace from a detector outline
 * @return std::nullopt for <3 points or an area below @p minArea
 *
 * The outline keeps the order the detector produced.
 */
std::optional<DetectedSpace> assembleSpace(const Polygon2D& polygon,
                                           const std::vector<WallID>& wallIds,
                                           double minArea = constants::MIN_SPACE_AREA);

/**
 * @brief Build a DetectedSpace from a user-drawn outline
 *
 * Normalizes to counter-clockwise and applies no area floor.
 */
std::optional<DetectedSpace> spaceFromPolygon(const Polygon2D& polygon,
                                              const std::vector<WallID>& wallIds = {});

/**
 * @brief True if both spaces are bounded by the same set of walls
 */
bool sameBoundingWalls(const DetectedSpace& a, const DetectedSpace& b);

/**
 * @brief Index of the first space bounded by the same walls as @p candidate
 */
std::optional<size_t> findSpaceWithSameWalls(const std::vector<DetectedSpace>& spaces,
                                             const DetectedSpace& candidate);

} // namespace roomtrace::core::space

#endif // ROOMTRACE_CORE_SPACE_SPACE_ASSEMBLER_H
