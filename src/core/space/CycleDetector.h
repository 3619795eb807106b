/**
 * @file CycleDetector.h
 * @brief Minimal enclosed face extraction from a WallGraph
 *
 * Faces are found by boundary tracing: starting from a directed half edge,
 * always leave a junction through the edge making the largest left turn.
 * That walks every bounded face counter-clockwise and the outline of each
 * connected component clockwise.
 *
 * Tracing is keyed on directed edges (from node, to node, wall). A wall
 * between two rooms is walked once from each side, so it can close off
 * both rooms; an undirected visited set would hand it to whichever room
 * was traced first.
 */

#ifndef ROOMTRACE_CORE_SPACE_CYCLE_DETECTOR_H
#define ROOMTRACE_CORE_SPACE_CYCLE_DETECTOR_H

#include "SpaceTypes.h"
#include "WallGraph.h"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace roomtrace::core::space {

/**
 * @brief Closed traversal through the graph
 *
 * points[i] is the node the walk leaves through wallIds[i]; the last wall
 * leads back to points[0].
 */
struct Cycle {
    Polygon2D points;
    std::vector<WallID> wallIds;
};

/**
 * @brief Configuration for cycle detection
 */
struct CycleDetectorConfig {
    /// Cycles enclosing less than this are discarded (m²)
    double minArea = constants::MIN_SPACE_AREA;

    /// A trace that has not closed after this many steps is abandoned
    int maxTraceSteps = constants::MAX_TRACE_STEPS;
};

/**
 * @brief Counters from the last findCycles() call
 */
struct CycleDetectorStats {
    int tracesStarted = 0;
    int tracesAbandoned = 0;
    int outerBoundaries = 0;
    int duplicates = 0;
    int belowMinArea = 0;
};

/**
 * @brief Extracts every room-sized face of a wall graph exactly once
 */
class MinimalCycleDetector {
public:
    MinimalCycleDetector();
    explicit MinimalCycleDetector(const CycleDetectorConfig& config);

    /**
     * @brief Find all minimal enclosed faces
     * @return Counter-clockwise cycles, largest area first
     *
     * Outer outlines (clockwise traces) are consumed but not returned.
     * Cycles with the same wall set collapse to one, as do cycles tracing
     * the same outline over duplicated walls (smaller wall set wins).
     */
    std::vector<Cycle> findCycles(const WallGraph& graph);

    const CycleDetectorStats& stats() const { return stats_; }

    void setConfig(const CycleDetectorConfig& config) { config_ = config; }
    const CycleDetectorConfig& getConfig() const { return config_; }

    /**
     * @brief Order-independent key of a cycle's wall set
     */
    static std::string cycleKey(const Cycle& cycle);

private:
    /// Per-call tracing state, never shared between calls
    struct TraceContext {
        std::unordered_set<std::string> visitedDirectedEdges;
    };

    std::optional<Cycle> traceFrom(const WallGraph& graph,
                                   const GraphNode& startNode,
                                   const GraphEdge& startEdge,
                                   TraceContext& context) const;

    /**
     * @brief Pick the outgoing edge with the largest left turn
     *
     * Ties (collinear candidates) go to the nearer target node, then to
     * the smaller wall ID. Doubling back to @p fromNode over a duplicate
     * wall ranks last.
     */
    const GraphEdge* selectLeftmostEdge(const WallGraph& graph,
                                        const GraphNode& node,
                                        const GraphNode& fromNode,
                                        const GraphEdge& incoming,
                                        const std::unordered_set<std::string>& usedInTrace) const;

    CycleDetectorConfig config_;
    CycleDetectorStats stats_;
};

} // namespace roomtrace::core::space

#endif // ROOMTRACE_CORE_SPACE_CYCLE_DETECTOR_H
