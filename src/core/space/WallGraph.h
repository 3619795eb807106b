/**
 * @file WallGraph.h
 * @brief Planar wall graph with tolerance-merged endpoints
 *
 * Every wall endpoint is snapped to a node; nodes closer than the merge
 * tolerance are the same node. Each usable wall contributes two directed
 * half edges, one leaving each endpoint, both carrying the wall ID.
 *
 * Nodes live in an arena and are addressed by a canonical coordinate key.
 * Edges refer to their target by key only, never by pointer, so the arena
 * can grow while edges are being added.
 */

#ifndef ROOMTRACE_CORE_SPACE_WALL_GRAPH_H
#define ROOMTRACE_CORE_SPACE_WALL_GRAPH_H

#include "SpaceTypes.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace roomtrace::core::space {

/**
 * @brief Directed half of a wall, stored on the node it leaves
 */
struct GraphEdge {
    /// Wall this half edge belongs to
    WallID wallId;

    /// Key of the node this half edge points at
    std::string targetNodeKey;

    /// Raw wall endpoint at the owning node
    Point2D start;

    /// Raw wall endpoint at the target node
    Point2D end;
};

/**
 * @brief Merged wall endpoint
 */
struct GraphNode {
    std::string key;

    /// Position of the first endpoint that created the node
    Point2D point;

    /// Outgoing half edges
    std::vector<GraphEdge> edges;

    size_t degree() const { return edges.size(); }
};

/**
 * @brief Node arena plus key index
 */
class WallGraph {
public:
    const std::vector<GraphNode>& nodes() const { return nodes_; }

    /**
     * @brief Look up a node by key
     * @return nullptr if no node has this key
     */
    const GraphNode* findNode(const std::string& key) const;

    /**
     * @brief Total number of directed half edges (twice the wall count)
     */
    size_t directedEdgeCount() const;

    bool empty() const { return nodes_.empty(); }

private:
    friend class WallGraphBuilder;

    std::vector<GraphNode> nodes_;
    std::unordered_map<std::string, size_t> nodeIndex_;
};

/**
 * @brief Counters from the last build() call
 */
struct WallGraphStats {
    size_t wallsAdded = 0;
    size_t degenerateWalls = 0;
    size_t prunedWalls = 0;
};

/**
 * @brief Builds a WallGraph from wall segments
 *
 * Endpoint lookup is a linear scan over the existing nodes (first node
 * within tolerance wins), which keeps the build O(W²) but exact for the
 * wall counts a floor plan produces.
 */
class WallGraphBuilder {
public:
    explicit WallGraphBuilder(double tolerance = constants::MERGE_TOLERANCE);

    /**
     * @brief Build the graph
     * @param walls Input walls, any order
     * @param pruneFilaments Detach dangling walls that cannot bound a region
     *
     * Walls whose endpoints merge into one node are skipped.
     */
    WallGraph build(const std::vector<WallSegment>& walls, bool pruneFilaments = true);

    /**
     * @brief Walls that build() would insert, in input order, before pruning
     *
     * Applies the same merge test as build(): walls shorter than the
     * tolerance and walls whose ends snap onto one node are left out.
     */
    std::vector<WallSegment> usableWalls(const std::vector<WallSegment>& walls);

    const WallGraphStats& stats() const { return stats_; }
    double tolerance() const { return tolerance_; }

    /**
     * @brief Canonical node key: coordinates rounded to the tolerance grid
     *
     * Uses ceil(-log10(tolerance)) decimals, e.g. "4.00_3.00" for 5 cm.
     */
    static std::string makeNodeKey(const Point2D& point, double tolerance);

private:
    bool addWall(WallGraph& graph, const WallSegment& wall);
    size_t findOrCreateNode(WallGraph& graph, const Point2D& point) const;
    size_t pruneDanglingWalls(WallGraph& graph) const;

    double tolerance_;
    WallGraphStats stats_;
};

} // namespace roomtrace::core::space

#endif // ROOMTRACE_CORE_SPACE_WALL_GRAPH_H
