#include "WallGraph.h"
#include "PolygonMath.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace roomtrace::core::space {

Q_LOGGING_CATEGORY(logWallGraph, "roomtrace.core.space.graph")

namespace {
constexpr double kMinKeyTolerance = 1e-9;
constexpr int kMaxKeyPrecision = 9;
} // namespace

const GraphNode* WallGraph::findNode(const std::string& key) const {
    auto it = nodeIndex_.find(key);
    if (it == nodeIndex_.end()) {
        return nullptr;
    }
    return &nodes_[it->second];
}

size_t WallGraph::directedEdgeCount() const {
    size_t count = 0;
    for (const auto& node : nodes_) {
        count += node.edges.size();
    }
    return count;
}

WallGraphBuilder::WallGraphBuilder(double tolerance)
    : tolerance_(tolerance) {
}

std::string WallGraphBuilder::makeNodeKey(const Point2D& point, double tolerance) {
    double snap = tolerance > 0.0 ? tolerance : kMinKeyTolerance;
    int precision = static_cast<int>(std::ceil(-std::log10(snap)));
    precision = std::clamp(precision, 0, kMaxKeyPrecision);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << point.x << '_' << point.y;
    return oss.str();
}

WallGraph WallGraphBuilder::build(const std::vector<WallSegment>& walls, bool pruneFilaments) {
    stats_ = {};
    WallGraph graph;

    for (const auto& wall : walls) {
        addWall(graph, wall);
    }

    if (pruneFilaments) {
        stats_.prunedWalls = pruneDanglingWalls(graph);
    }

    qCDebug(logWallGraph) << "graph-built"
                          << "walls=" << walls.size()
                          << "nodes=" << graph.nodes_.size()
                          << "directedEdges=" << graph.directedEdgeCount()
                          << "degenerate=" << stats_.degenerateWalls
                          << "pruned=" << stats_.prunedWalls;
    return graph;
}

std::vector<WallSegment> WallGraphBuilder::usableWalls(const std::vector<WallSegment>& walls) {
    stats_ = {};
    WallGraph scratch;
    std::vector<WallSegment> usable;
    usable.reserve(walls.size());
    for (const auto& wall : walls) {
        if (addWall(scratch, wall)) {
            usable.push_back(wall);
        }
    }
    return usable;
}

bool WallGraphBuilder::addWall(WallGraph& graph, const WallSegment& wall) {
    if (pointDistance(wall.start, wall.end) < tolerance_) {
        ++stats_.degenerateWalls;
        qCDebug(logWallGraph) << "skip:degenerate-wall" << "id=" << QString::fromStdString(wall.id);
        return false;
    }

    const size_t startIndex = findOrCreateNode(graph, wall.start);
    const size_t endIndex = findOrCreateNode(graph, wall.end);
    if (startIndex == endIndex) {
        // Both ends snapped onto the same existing node.
        ++stats_.degenerateWalls;
        qCDebug(logWallGraph) << "skip:self-loop" << "id=" << QString::fromStdString(wall.id)
                              << "node=" << QString::fromStdString(graph.nodes_[startIndex].key);
        return false;
    }

    const std::string startKey = graph.nodes_[startIndex].key;
    const std::string endKey = graph.nodes_[endIndex].key;
    graph.nodes_[startIndex].edges.push_back({wall.id, endKey, wall.start, wall.end});
    graph.nodes_[endIndex].edges.push_back({wall.id, startKey, wall.end, wall.start});
    ++stats_.wallsAdded;
    return true;
}

size_t WallGraphBuilder::findOrCreateNode(WallGraph& graph, const Point2D& point) const {
    for (size_t i = 0; i < graph.nodes_.size(); ++i) {
        if (pointDistance(graph.nodes_[i].point, point) < tolerance_) {
            return i;
        }
    }

    std::string key = makeNodeKey(point, tolerance_);
    if (graph.nodeIndex_.count(key) > 0) {
        // Grid rounding can be coarser than the merge radius.
        const std::string base = key;
        int suffix = 1;
        do {
            key = base + "#" + std::to_string(suffix++);
        } while (graph.nodeIndex_.count(key) > 0);
    }

    GraphNode node;
    node.key = key;
    node.point = point;
    graph.nodeIndex_[key] = graph.nodes_.size();
    graph.nodes_.push_back(std::move(node));
    return graph.nodes_.size() - 1;
}

size_t WallGraphBuilder::pruneDanglingWalls(WallGraph& graph) const {
    std::vector<size_t> pending;
    for (size_t i = 0; i < graph.nodes_.size(); ++i) {
        if (graph.nodes_[i].degree() == 1) {
            pending.push_back(i);
        }
    }

    size_t removed = 0;
    while (!pending.empty()) {
        size_t index = pending.back();
        pending.pop_back();

        GraphNode& node = graph.nodes_[index];
        if (node.degree() != 1) {
            continue;
        }
        const GraphEdge edge = node.edges.front();
        node.edges.clear();
        ++removed;

        auto targetIt = graph.nodeIndex_.find(edge.targetNodeKey);
        if (targetIt == graph.nodeIndex_.end()) {
            continue;
        }
        GraphNode& target = graph.nodes_[targetIt->second];
        auto twin = std::find_if(target.edges.begin(), target.edges.end(),
                                 [&](const GraphEdge& candidate) {
                                     return candidate.wallId == edge.wallId &&
                                            candidate.targetNodeKey == node.key;
                                 });
        if (twin != target.edges.end()) {
            target.edges.erase(twin);
        }
        if (target.degree() == 1) {
            pending.push_back(targetIt->second);
        }

        qCDebug(logWallGraph) << "prune:dangling-wall" << "id=" << QString::fromStdString(edge.wallId);
    }
    return removed;
}

} // namespace roomtrace::core::space
