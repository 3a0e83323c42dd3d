#include "canvascore/graph/MutationRecord.h"

#include <format>

namespace canvascore {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void appendEdges(std::vector<EntityRef>& out, const std::vector<Edge>& edges) {
    for (const auto& edge : edges) {
        out.push_back(EntityRef::edge(edge.id));
    }
}

}  // namespace

const char* mutationKindToString(MutationKind kind) {
    switch (kind) {
        case MutationKind::CreateNode: return "CreateNode";
        case MutationKind::DeleteNode: return "DeleteNode";
        case MutationKind::UpdateNode: return "UpdateNode";
        case MutationKind::MoveNode: return "MoveNode";
        case MutationKind::CreateEdge: return "CreateEdge";
        case MutationKind::DeleteEdge: return "DeleteEdge";
        case MutationKind::UpdateEdge: return "UpdateEdge";
    }
    return "Unknown";
}

// === Factories ===

MutationRecord MutationRecord::createNode(Node node, std::vector<Edge> restoredEdges) {
    return MutationRecord(CreateNodeRecord{std::move(node), std::move(restoredEdges)});
}

MutationRecord MutationRecord::deleteNode(Node node, std::vector<Edge> cascadedEdges) {
    return MutationRecord(DeleteNodeRecord{std::move(node), std::move(cascadedEdges)});
}

MutationRecord MutationRecord::updateNode(Node before, Node after) {
    return MutationRecord(UpdateNodeRecord{std::move(before), std::move(after)});
}

MutationRecord MutationRecord::moveNode(NodeId id, Point from, Point to,
                                        Timestamp fromUpdatedAt, Timestamp toUpdatedAt) {
    return MutationRecord(MoveNodeRecord{id, from, to, fromUpdatedAt, toUpdatedAt});
}

MutationRecord MutationRecord::createEdge(Edge edge) {
    return MutationRecord(CreateEdgeRecord{std::move(edge)});
}

MutationRecord MutationRecord::deleteEdge(Edge edge) {
    return MutationRecord(DeleteEdgeRecord{std::move(edge)});
}

MutationRecord MutationRecord::updateEdge(Edge before, Edge after) {
    return MutationRecord(UpdateEdgeRecord{std::move(before), std::move(after)});
}

// === Queries ===

MutationKind MutationRecord::kind() const {
    // Variant alternatives are declared in MutationKind order
    return static_cast<MutationKind>(payload_.index());
}

uint64_t MutationRecord::targetId() const {
    return std::visit(Overloaded{
        [](const CreateNodeRecord& r) -> uint64_t { return r.node.id; },
        [](const DeleteNodeRecord& r) -> uint64_t { return r.node.id; },
        [](const UpdateNodeRecord& r) -> uint64_t { return r.after.id; },
        [](const MoveNodeRecord& r) -> uint64_t { return r.id; },
        [](const CreateEdgeRecord& r) -> uint64_t { return r.edge.id; },
        [](const DeleteEdgeRecord& r) -> uint64_t { return r.edge.id; },
        [](const UpdateEdgeRecord& r) -> uint64_t { return r.after.id; },
    }, payload_);
}

MutationRecord MutationRecord::inverse() const {
    return std::visit(Overloaded{
        [](const CreateNodeRecord& r) {
            return MutationRecord(DeleteNodeRecord{r.node, r.restoredEdges});
        },
        [](const DeleteNodeRecord& r) {
            return MutationRecord(CreateNodeRecord{r.node, r.cascadedEdges});
        },
        [](const UpdateNodeRecord& r) {
            return MutationRecord(UpdateNodeRecord{r.after, r.before});
        },
        [](const MoveNodeRecord& r) {
            return MutationRecord(MoveNodeRecord{r.id, r.to, r.from, r.toUpdatedAt, r.fromUpdatedAt});
        },
        [](const CreateEdgeRecord& r) {
            return MutationRecord(DeleteEdgeRecord{r.edge});
        },
        [](const DeleteEdgeRecord& r) {
            return MutationRecord(CreateEdgeRecord{r.edge});
        },
        [](const UpdateEdgeRecord& r) {
            return MutationRecord(UpdateEdgeRecord{r.after, r.before});
        },
    }, payload_);
}

std::vector<EntityRef> MutationRecord::affectedEntities() const {
    std::vector<EntityRef> refs;
    std::visit(Overloaded{
        [&](const CreateNodeRecord& r) {
            refs.push_back(EntityRef::node(r.node.id));
            appendEdges(refs, r.restoredEdges);
        },
        [&](const DeleteNodeRecord& r) {
            refs.push_back(EntityRef::node(r.node.id));
            appendEdges(refs, r.cascadedEdges);
        },
        [&](const UpdateNodeRecord& r) { refs.push_back(EntityRef::node(r.after.id)); },
        [&](const MoveNodeRecord& r) { refs.push_back(EntityRef::node(r.id)); },
        [&](const CreateEdgeRecord& r) { refs.push_back(EntityRef::edge(r.edge.id)); },
        [&](const DeleteEdgeRecord& r) { refs.push_back(EntityRef::edge(r.edge.id)); },
        [&](const UpdateEdgeRecord& r) { refs.push_back(EntityRef::edge(r.after.id)); },
    }, payload_);
    return refs;
}

// === Coalescing ===

bool MutationRecord::canCoalesceWith(const MutationRecord& newer) const {
    if (kind() != newer.kind() || targetId() != newer.targetId()) {
        return false;
    }
    switch (kind()) {
        case MutationKind::MoveNode:
        case MutationKind::UpdateNode:
        case MutationKind::UpdateEdge:
            return true;
        default:
            return false;
    }
}

void MutationRecord::coalesce(const MutationRecord& newer) {
    if (auto* move = std::get_if<MoveNodeRecord>(&payload_)) {
        const auto& next = std::get<MoveNodeRecord>(newer.payload_);
        move->to = next.to;
        move->toUpdatedAt = next.toUpdatedAt;
    } else if (auto* update = std::get_if<UpdateNodeRecord>(&payload_)) {
        update->after = std::get<UpdateNodeRecord>(newer.payload_).after;
    } else if (auto* edgeUpdate = std::get_if<UpdateEdgeRecord>(&payload_)) {
        edgeUpdate->after = std::get<UpdateEdgeRecord>(newer.payload_).after;
    }
}

std::string MutationRecord::describe() const {
    std::string text = std::format("{}#{}", mutationKindToString(kind()), targetId());
    if (const auto* del = as<DeleteNodeRecord>(); del && !del->cascadedEdges.empty()) {
        text += std::format(" (+{} edges)", del->cascadedEdges.size());
    } else if (const auto* create = as<CreateNodeRecord>(); create && !create->restoredEdges.empty()) {
        text += std::format(" (+{} edges)", create->restoredEdges.size());
    }
    return text;
}

}  // namespace canvascore
