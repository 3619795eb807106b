#include "CycleDetector.h"
#include "PolygonMath.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <numbers>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace roomtrace::core::space {

Q_LOGGING_CATEGORY(logCycleDetector, "roomtrace.core.space.cycles")

namespace {

constexpr double kTurnTieEpsilon = 1e-9;
constexpr double kDistanceTieEpsilon = 1e-9;

std::string directedEdgeKey(const std::string& fromKey, const std::string& toKey,
                            const WallID& wallId) {
    std::string key;
    key.reserve(fromKey.size() + toKey.size() + wallId.size() + 3);
    key.append(fromKey);
    key.append("->");
    key.append(toKey);
    key.push_back('|');
    key.append(wallId);
    return key;
}

double directionAngle(const Point2D& from, const Point2D& to) {
    return std::atan2(to.y - from.y, to.x - from.x);
}

/// Wrap into (-pi, pi]
double normalizeTurn(double angle) {
    constexpr double pi = std::numbers::pi_v<double>;
    while (angle > pi) {
        angle -= 2.0 * pi;
    }
    while (angle <= -pi) {
        angle += 2.0 * pi;
    }
    return angle;
}

std::vector<WallID> sortedWallIds(const Cycle& cycle) {
    std::vector<WallID> sorted = cycle.wallIds;
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

/// Order-independent key of the node positions a cycle visits
std::string outlineKey(const Cycle& cycle) {
    std::vector<std::pair<double, double>> points;
    points.reserve(cycle.points.size());
    for (const auto& p : cycle.points) {
        points.emplace_back(p.x, p.y);
    }
    std::sort(points.begin(), points.end());

    std::ostringstream oss;
    oss << std::setprecision(12);
    for (const auto& [x, y] : points) {
        oss << x << ',' << y << ';';
    }
    return oss.str();
}

} // namespace

MinimalCycleDetector::MinimalCycleDetector()
    : config_() {
}

MinimalCycleDetector::MinimalCycleDetector(const CycleDetectorConfig& config)
    : config_(config) {
}

std::string MinimalCycleDetector::cycleKey(const Cycle& cycle) {
    const std::vector<WallID> sorted = sortedWallIds(cycle);
    std::string key;
    key.reserve(sorted.size() * 40);
    for (const auto& id : sorted) {
        key.append(id);
        key.push_back('|');
    }
    return key;
}

std::vector<Cycle> MinimalCycleDetector::findCycles(const WallGraph& graph) {
    stats_ = {};
    TraceContext context;
    std::vector<Cycle> cycles;

    for (const auto& node : graph.nodes()) {
        if (node.degree() < 2) {
            continue;
        }
        for (const auto& edge : node.edges) {
            const std::string key = directedEdgeKey(node.key, edge.targetNodeKey, edge.wallId);
            if (context.visitedDirectedEdges.count(key) > 0) {
                continue;
            }

            ++stats_.tracesStarted;
            auto cycle = traceFrom(graph, node, edge, context);
            if (!cycle.has_value()) {
                ++stats_.tracesAbandoned;
                qCDebug(logCycleDetector) << "trace:abandoned"
                                          << "startNode=" << QString::fromStdString(node.key)
                                          << "startWall=" << QString::fromStdString(edge.wallId);
                continue;
            }

            if (signedArea(cycle->points) <= 0.0) {
                // Clockwise walk: the outline around a group of rooms.
                ++stats_.outerBoundaries;
                continue;
            }
            cycles.push_back(std::move(*cycle));
        }
    }

    std::vector<Cycle> unique;
    unique.reserve(cycles.size());
    std::unordered_set<std::string> seen;
    std::unordered_map<std::string, size_t> byOutline;
    for (auto& cycle : cycles) {
        if (!seen.insert(cycleKey(cycle)).second) {
            ++stats_.duplicates;
            continue;
        }
        if (polygonArea(cycle.points) < config_.minArea) {
            ++stats_.belowMinArea;
            continue;
        }

        // Duplicate walls between the same two nodes trace the same outline
        // twice with different wall sets; keep the smaller ID set.
        auto [it, inserted] = byOutline.emplace(outlineKey(cycle), unique.size());
        if (!inserted) {
            ++stats_.duplicates;
            Cycle& kept = unique[it->second];
            if (sortedWallIds(cycle) < sortedWallIds(kept)) {
                kept = std::move(cycle);
            }
            continue;
        }
        unique.push_back(std::move(cycle));
    }

    std::stable_sort(unique.begin(), unique.end(), [](const Cycle& a, const Cycle& b) {
        return polygonArea(a.points) > polygonArea(b.points);
    });

    qCDebug(logCycleDetector) << "cycles-found"
                              << "count=" << unique.size()
                              << "traces=" << stats_.tracesStarted
                              << "abandoned=" << stats_.tracesAbandoned
                              << "outer=" << stats_.outerBoundaries
                              << "duplicates=" << stats_.duplicates
                              << "tooSmall=" << stats_.belowMinArea;
    return unique;
}

std::optional<Cycle> MinimalCycleDetector::traceFrom(const WallGraph& graph,
                                                     const GraphNode& startNode,
                                                     const GraphEdge& startEdge,
                                                     TraceContext& context) const {
    std::vector<std::pair<const GraphNode*, const GraphEdge*>> path;
    std::unordered_set<std::string> usedInTrace;

    const GraphNode* current = &startNode;
    const GraphEdge* edge = &startEdge;

    for (int step = 0; step < config_.maxTraceSteps; ++step) {
        const GraphNode* target = graph.findNode(edge->targetNodeKey);
        if (!target) {
            break;
        }

        path.emplace_back(current, edge);
        usedInTrace.insert(directedEdgeKey(current->key, target->key, edge->wallId));

        if (target->key == startNode.key && path.size() >= 3) {
            Cycle cycle;
            cycle.points.reserve(path.size());
            cycle.wallIds.reserve(path.size());
            for (const auto& [node, pathEdge] : path) {
                context.visitedDirectedEdges.insert(
                    directedEdgeKey(node->key, pathEdge->targetNodeKey, pathEdge->wallId));
                cycle.points.push_back(node->point);
                cycle.wallIds.push_back(pathEdge->wallId);
            }
            return cycle;
        }

        const GraphEdge* next = selectLeftmostEdge(graph, *target, *current, *edge, usedInTrace);
        if (!next) {
            break;
        }
        current = target;
        edge = next;
    }

    return std::nullopt;
}

const GraphEdge* MinimalCycleDetector::selectLeftmostEdge(
    const WallGraph& graph,
    const GraphNode& node,
    const GraphNode& fromNode,
    const GraphEdge& incoming,
    const std::unordered_set<std::string>& usedInTrace) const {
    const double inAngle = directionAngle(fromNode.point, node.point);

    const GraphEdge* best = nullptr;
    double bestTurn = -std::numeric_limits<double>::infinity();
    double bestLength = std::numeric_limits<double>::infinity();

    for (const auto& candidate : node.edges) {
        if (candidate.wallId == incoming.wallId) {
            continue;
        }
        if (usedInTrace.count(directedEdgeKey(node.key, candidate.targetNodeKey, candidate.wallId)) > 0) {
            continue;
        }
        const GraphNode* target = graph.findNode(candidate.targetNodeKey);
        if (!target) {
            continue;
        }

        // Doubling back over a duplicate wall ranks below every real turn.
        const double turn = (target->key == fromNode.key)
                                ? -std::numbers::pi_v<double>
                                : normalizeTurn(directionAngle(node.point, target->point) - inAngle);
        const double length = pointDistance(node.point, target->point);

        bool better = false;
        if (!best || turn > bestTurn + kTurnTieEpsilon) {
            better = true;
        } else if (std::abs(turn - bestTurn) <= kTurnTieEpsilon) {
            if (length < bestLength - kDistanceTieEpsilon) {
                better = true;
            } else if (std::abs(length - bestLength) <= kDistanceTieEpsilon &&
                       candidate.wallId < best->wallId) {
                better = true;
            }
        }

        if (better) {
            best = &candidate;
            bestTurn = turn;
            bestLength = length;
        }
    }

    return best;
}

} // namespace roomtrace::core::space
