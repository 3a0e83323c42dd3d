#include "canvascore/graph/GraphStore.h"
#include "canvascore/common/Logger.h"

#include <algorithm>

namespace canvascore {

namespace {

template <typename T>
const T* findById(const std::vector<T>& items, uint64_t id) {
    auto it = std::lower_bound(items.begin(), items.end(), id,
        [](const T& item, uint64_t value) { return item.id < value; });
    if (it != items.end() && it->id == id) {
        return &*it;
    }
    return nullptr;
}

}  // namespace

const Node* GraphSnapshot::findNode(NodeId id) const {
    return findById(nodes, id);
}

const Edge* GraphSnapshot::findEdge(EdgeId id) const {
    return findById(edges, id);
}

GraphStore::GraphStore(GraphLimits limits)
    : limits_(limits) {
}

// =============================================================================
// Validation
// =============================================================================

ApplyResult GraphStore::checkCurrentNode(const Node& expected) const {
    auto it = nodes_.find(expected.id);
    if (it == nodes_.end()) {
        return ApplyResult::fail(GraphError::NodeNotFound,
                                 std::format("node {} does not exist", expected.id));
    }
    if (!(it->second == expected)) {
        return ApplyResult::fail(GraphError::StaleRecord,
                                 std::format("node {} changed since the record was taken", expected.id));
    }
    return ApplyResult::success(version_);
}

ApplyResult GraphStore::checkCurrentEdge(const Edge& expected) const {
    auto it = edges_.find(expected.id);
    if (it == edges_.end()) {
        return ApplyResult::fail(GraphError::EdgeNotFound,
                                 std::format("edge {} does not exist", expected.id));
    }
    if (!(it->second == expected)) {
        return ApplyResult::fail(GraphError::StaleRecord,
                                 std::format("edge {} changed since the record was taken", expected.id));
    }
    return ApplyResult::success(version_);
}

ApplyResult GraphStore::checkEdgeInsert(const Edge& edge, size_t pendingEdges) const {
    if (edge.id == INVALID_EDGE || edges_.count(edge.id) > 0) {
        return ApplyResult::fail(GraphError::DuplicateId,
                                 std::format("edge id {} is unavailable", edge.id));
    }
    if (edge.source == edge.target) {
        return ApplyResult::fail(GraphError::SelfLoop,
                                 std::format("edge {} connects node {} to itself", edge.id, edge.source));
    }
    if (!hasNode(edge.source) || !hasNode(edge.target)) {
        return ApplyResult::fail(GraphError::MissingEndpoint,
                                 std::format("edge {} endpoints {} -> {} do not both exist",
                                             edge.id, edge.source, edge.target));
    }
    if (edges_.size() + pendingEdges >= limits_.maxEdges) {
        return ApplyResult::fail(GraphError::CapacityExceeded,
                                 std::format("edge limit {} reached", limits_.maxEdges));
    }
    return ApplyResult::success(version_);
}

ApplyResult GraphStore::checkNodeInsert(const Node& node, const std::vector<Edge>& edges) const {
    if (node.id == INVALID_NODE || hasNode(node.id)) {
        return ApplyResult::fail(GraphError::DuplicateId,
                                 std::format("node id {} is unavailable", node.id));
    }
    if (!limits_.sizeAllowed(node.size)) {
        return ApplyResult::fail(GraphError::InvalidSize,
                                 std::format("node size {}x{} outside limits",
                                             node.size.width, node.size.height));
    }
    if (nodes_.size() >= limits_.maxNodes) {
        return ApplyResult::fail(GraphError::CapacityExceeded,
                                 std::format("node limit {} reached", limits_.maxNodes));
    }

    std::set<EdgeId> seen;
    for (const auto& edge : edges) {
        if (!edge.touches(node.id)) {
            return ApplyResult::fail(GraphError::CascadeMismatch,
                                     std::format("restored edge {} is not incident to node {}",
                                                 edge.id, node.id));
        }
        if (edge.id == INVALID_EDGE || hasEdge(edge.id) || !seen.insert(edge.id).second) {
            return ApplyResult::fail(GraphError::DuplicateId,
                                     std::format("edge id {} is unavailable", edge.id));
        }
        if (edge.source == edge.target) {
            return ApplyResult::fail(GraphError::SelfLoop,
                                     std::format("edge {} connects node {} to itself", edge.id, node.id));
        }
        NodeId other = edge.source == node.id ? edge.target : edge.source;
        if (!hasNode(other)) {
            return ApplyResult::fail(GraphError::MissingEndpoint,
                                     std::format("restored edge {} needs missing node {}", edge.id, other));
        }
    }
    if (edges_.size() + edges.size() > limits_.maxEdges) {
        return ApplyResult::fail(GraphError::CapacityExceeded,
                                 std::format("edge limit {} reached", limits_.maxEdges));
    }
    return ApplyResult::success(version_);
}

ApplyResult GraphStore::checkNodeRemove(const Node& node, const std::vector<Edge>& edges) const {
    if (auto current = checkCurrentNode(node); !current) {
        return current;
    }

    // The record must carry exactly the incident edge set, otherwise undo
    // could not bring the connections back.
    std::set<EdgeId> listed;
    for (const auto& edge : edges) {
        if (!listed.insert(edge.id).second) {
            return ApplyResult::fail(GraphError::CascadeMismatch,
                                     std::format("edge {} listed twice", edge.id));
        }
        if (auto current = checkCurrentEdge(edge); !current) {
            return current;
        }
    }

    static const std::set<EdgeId> kNoEdges;
    auto it = incidence_.find(node.id);
    const auto& incident = it != incidence_.end() ? it->second : kNoEdges;
    if (listed != incident) {
        return ApplyResult::fail(GraphError::CascadeMismatch,
                                 std::format("node {} has {} incident edges, record lists {}",
                                             node.id, incident.size(), listed.size()));
    }
    return ApplyResult::success(version_);
}

ApplyResult GraphStore::validate(const MutationRecord& record) const {
    switch (record.kind()) {
        case MutationKind::CreateNode: {
            const auto& r = std::get<CreateNodeRecord>(record.payload());
            return checkNodeInsert(r.node, r.restoredEdges);
        }
        case MutationKind::DeleteNode: {
            const auto& r = std::get<DeleteNodeRecord>(record.payload());
            return checkNodeRemove(r.node, r.cascadedEdges);
        }
        case MutationKind::UpdateNode: {
            const auto& r = std::get<UpdateNodeRecord>(record.payload());
            if (auto current = checkCurrentNode(r.before); !current) {
                return current;
            }
            if (r.after.id != r.before.id || r.after.createdAt != r.before.createdAt) {
                return ApplyResult::fail(GraphError::StaleRecord,
                                         std::format("update of node {} changes its identity", r.before.id));
            }
            if (r.after.size != r.before.size && !limits_.sizeAllowed(r.after.size)) {
                return ApplyResult::fail(GraphError::InvalidSize,
                                         std::format("node size {}x{} outside limits",
                                                     r.after.size.width, r.after.size.height));
            }
            return ApplyResult::success(version_);
        }
        case MutationKind::MoveNode: {
            const auto& r = std::get<MoveNodeRecord>(record.payload());
            const Node* node = findNode(r.id);
            if (!node) {
                return ApplyResult::fail(GraphError::NodeNotFound,
                                         std::format("node {} does not exist", r.id));
            }
            if (node->position != r.from || node->updatedAt != r.fromUpdatedAt) {
                return ApplyResult::fail(GraphError::StaleRecord,
                                         std::format("node {} is not at the move's start position", r.id));
            }
            return ApplyResult::success(version_);
        }
        case MutationKind::CreateEdge: {
            const auto& r = std::get<CreateEdgeRecord>(record.payload());
            return checkEdgeInsert(r.edge, 0);
        }
        case MutationKind::DeleteEdge: {
            const auto& r = std::get<DeleteEdgeRecord>(record.payload());
            return checkCurrentEdge(r.edge);
        }
        case MutationKind::UpdateEdge: {
            const auto& r = std::get<UpdateEdgeRecord>(record.payload());
            if (auto current = checkCurrentEdge(r.before); !current) {
                return current;
            }
            if (r.after.id != r.before.id || r.after.source != r.before.source ||
                r.after.target != r.before.target || r.after.createdAt != r.before.createdAt) {
                return ApplyResult::fail(GraphError::StaleRecord,
                                         std::format("update of edge {} changes its endpoints", r.before.id));
            }
            return ApplyResult::success(version_);
        }
    }
    return ApplyResult::fail(GraphError::StaleRecord, "unknown record kind");
}

// =============================================================================
// Mutation
// =============================================================================

ApplyResult GraphStore::apply(const MutationRecord& record) {
    ApplyResult check = validate(record);
    if (!check) {
        check.version = version_;
        LOG_WARN("rejected {}: {}", record.describe(), check.toString());
        return check;
    }

    switch (record.kind()) {
        case MutationKind::CreateNode: {
            const auto& r = std::get<CreateNodeRecord>(record.payload());
            nodes_.emplace(r.node.id, r.node);
            incidence_[r.node.id];
            for (const auto& edge : r.restoredEdges) {
                insertEdge(edge);
            }
            break;
        }
        case MutationKind::DeleteNode: {
            const auto& r = std::get<DeleteNodeRecord>(record.payload());
            for (const auto& edge : r.cascadedEdges) {
                eraseEdge(edge.id);
            }
            incidence_.erase(r.node.id);
            nodes_.erase(r.node.id);
            break;
        }
        case MutationKind::UpdateNode: {
            const auto& r = std::get<UpdateNodeRecord>(record.payload());
            nodes_[r.after.id] = r.after;
            break;
        }
        case MutationKind::MoveNode: {
            const auto& r = std::get<MoveNodeRecord>(record.payload());
            Node& node = nodes_.at(r.id);
            node.position = r.to;
            node.updatedAt = r.toUpdatedAt;
            break;
        }
        case MutationKind::CreateEdge:
            insertEdge(std::get<CreateEdgeRecord>(record.payload()).edge);
            break;
        case MutationKind::DeleteEdge:
            eraseEdge(std::get<DeleteEdgeRecord>(record.payload()).edge.id);
            break;
        case MutationKind::UpdateEdge: {
            const auto& r = std::get<UpdateEdgeRecord>(record.payload());
            edges_[r.after.id] = r.after;
            break;
        }
    }

    commit();
    LOG_TRACE("applied {} -> version {}", record.describe(), version_);
    return ApplyResult::success(version_);
}

void GraphStore::insertEdge(const Edge& edge) {
    edges_.emplace(edge.id, edge);
    incidence_[edge.source].insert(edge.id);
    incidence_[edge.target].insert(edge.id);
}

void GraphStore::eraseEdge(EdgeId id) {
    auto it = edges_.find(id);
    if (it == edges_.end()) {
        return;
    }
    incidence_[it->second.source].erase(id);
    incidence_[it->second.target].erase(id);
    edges_.erase(it);
}

void GraphStore::commit() {
    ++version_;
}

LoadReport GraphStore::load(std::vector<Node> nodes, std::vector<Edge> edges) {
    LoadReport report;

    nodes_.clear();
    edges_.clear();
    incidence_.clear();

    NodeId maxNodeId = 0;
    for (auto& node : nodes) {
        if (node.id == INVALID_NODE || hasNode(node.id)) {
            report.skippedNodes.push_back(node.id);
            continue;
        }
        maxNodeId = std::max(maxNodeId, node.id);
        incidence_[node.id];
        nodes_.emplace(node.id, std::move(node));
    }

    EdgeId maxEdgeId = 0;
    for (auto& edge : edges) {
        if (edge.id == INVALID_EDGE || hasEdge(edge.id) || edge.source == edge.target ||
            !hasNode(edge.source) || !hasNode(edge.target)) {
            report.prunedEdges.push_back(edge.id);
            continue;
        }
        maxEdgeId = std::max(maxEdgeId, edge.id);
        insertEdge(edge);
    }

    nextNodeId_ = std::max<NodeId>(nextNodeId_, maxNodeId + 1);
    nextEdgeId_ = std::max<EdgeId>(nextEdgeId_, maxEdgeId + 1);

    report.nodesLoaded = nodes_.size();
    report.edgesLoaded = edges_.size();
    commit();

    if (!report.prunedEdges.empty() || !report.skippedNodes.empty()) {
        LOG_WARN("load pruned {} edges and skipped {} nodes",
                 report.prunedEdges.size(), report.skippedNodes.size());
    }
    LOG_INFO("loaded {} nodes, {} edges (version {})",
             report.nodesLoaded, report.edgesLoaded, version_);
    return report;
}

// =============================================================================
// Read access
// =============================================================================

std::shared_ptr<const GraphSnapshot> GraphStore::snapshot() const {
    if (cachedSnapshot_ && cachedSnapshot_->version == version_) {
        return cachedSnapshot_;
    }

    auto snap = std::make_shared<GraphSnapshot>();
    snap->version = version_;
    snap->nodes.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        snap->nodes.push_back(node);
    }
    snap->edges.reserve(edges_.size());
    for (const auto& [id, edge] : edges_) {
        snap->edges.push_back(edge);
    }
    cachedSnapshot_ = std::move(snap);
    return cachedSnapshot_;
}

const Node* GraphStore::findNode(NodeId id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const Edge* GraphStore::findEdge(EdgeId id) const {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

std::vector<Edge> GraphStore::incidentEdges(NodeId id) const {
    std::vector<Edge> result;
    auto it = incidence_.find(id);
    if (it == incidence_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (EdgeId edgeId : it->second) {
        result.push_back(edges_.at(edgeId));
    }
    return result;
}

std::optional<std::string> GraphStore::effectiveEdgeColor(const Edge& edge) const {
    if (edge.color) {
        return edge.color;
    }
    if (const Node* source = findNode(edge.source)) {
        return source->color;
    }
    return std::nullopt;
}

}  // namespace canvascore
