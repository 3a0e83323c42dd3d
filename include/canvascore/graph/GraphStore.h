#pragma once

#include "GraphError.h"
#include "GraphTypes.h"
#include "MutationRecord.h"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace canvascore {

/// Size and count limits enforced by GraphStore
struct GraphLimits {
    Size minNodeSize{120.0f, 80.0f};
    Size maxNodeSize{4000.0f, 4000.0f};
    Size defaultNodeSize{400.0f, 160.0f};
    size_t maxNodes = 5000;
    size_t maxEdges = 6000;

    bool sizeAllowed(const Size& size) const {
        return size.width >= minNodeSize.width && size.height >= minNodeSize.height &&
               size.width <= maxNodeSize.width && size.height <= maxNodeSize.height;
    }
};

/// Immutable copy of the graph at one version.
/// Nodes and edges are sorted by id. Safe to hold across later mutations.
struct GraphSnapshot {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    uint64_t version = 0;

    const Node* findNode(NodeId id) const;
    const Edge* findEdge(EdgeId id) const;

    bool sameContent(const GraphSnapshot& other) const {
        return nodes == other.nodes && edges == other.edges;
    }
};

/// What load() accepted and what it dropped
struct LoadReport {
    size_t nodesLoaded = 0;
    size_t edgesLoaded = 0;
    std::vector<NodeId> skippedNodes;   ///< Duplicate or invalid ids
    std::vector<EdgeId> prunedEdges;    ///< Dangling, self-looping or duplicate edges
};

/**
 * @brief Authoritative in-memory graph
 *
 * Every mutation goes through apply(). A record is validated completely before
 * any state changes, so a rejected record leaves the graph and its version
 * untouched. A successful apply bumps the version exactly once, no matter how
 * many entities the record touches (a node delete with its edges is one bump).
 *
 * Edges store endpoint ids only and are resolved through lookup. A per-node
 * incidence index keeps cascade checks proportional to the node's degree.
 */
class GraphStore {
public:
    explicit GraphStore(GraphLimits limits = {});

    // =========================================================================
    // Mutation
    // =========================================================================

    ApplyResult apply(const MutationRecord& record);

    /// Check a record against the current state without applying it
    ApplyResult validate(const MutationRecord& record) const;

    /**
     * @brief Replace the whole graph with stored content
     *
     * Timestamps are kept verbatim. Edges whose endpoints are missing are
     * dropped and reported so the caller can delete them from storage.
     * Id allocation continues after the largest loaded id.
     */
    LoadReport load(std::vector<Node> nodes, std::vector<Edge> edges);

    NodeId allocateNodeId() { return nextNodeId_++; }
    EdgeId allocateEdgeId() { return nextEdgeId_++; }

    // =========================================================================
    // Read access
    // =========================================================================

    /// Snapshot of the current version, built lazily and shared until the next change
    std::shared_ptr<const GraphSnapshot> snapshot() const;

    uint64_t version() const { return version_; }

    const Node* findNode(NodeId id) const;
    const Edge* findEdge(EdgeId id) const;
    bool hasNode(NodeId id) const { return nodes_.count(id) > 0; }
    bool hasEdge(EdgeId id) const { return edges_.count(id) > 0; }
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    /// Edges with `id` as source or target, sorted by edge id
    std::vector<Edge> incidentEdges(NodeId id) const;

    /// Edge color, falling back to the source node's color when unset
    std::optional<std::string> effectiveEdgeColor(const Edge& edge) const;

    const GraphLimits& limits() const { return limits_; }
    void setLimits(const GraphLimits& limits) { limits_ = limits; }

private:
    ApplyResult checkNodeInsert(const Node& node, const std::vector<Edge>& edges) const;
    ApplyResult checkNodeRemove(const Node& node, const std::vector<Edge>& edges) const;
    ApplyResult checkEdgeInsert(const Edge& edge, size_t pendingEdges) const;
    ApplyResult checkCurrentNode(const Node& expected) const;
    ApplyResult checkCurrentEdge(const Edge& expected) const;

    void insertEdge(const Edge& edge);
    void eraseEdge(EdgeId id);
    void commit();

    GraphLimits limits_;
    std::map<NodeId, Node> nodes_;
    std::map<EdgeId, Edge> edges_;
    std::unordered_map<NodeId, std::set<EdgeId>> incidence_;

    uint64_t version_ = 0;
    NodeId nextNodeId_ = 1;
    EdgeId nextEdgeId_ = 1;

    mutable std::shared_ptr<const GraphSnapshot> cachedSnapshot_;
};

}  // namespace canvascore
