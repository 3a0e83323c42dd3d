#pragma once

#include "GraphTypes.h"

#include <utility>
#include <variant>
#include <vector>

namespace canvascore {

// =========================================================================
// Record payloads
// =========================================================================

/// Insert a node. `restoredEdges` is non-empty only when this record undoes a
/// DeleteNode: the node and its former edges come back in one step.
struct CreateNodeRecord {
    Node node;
    std::vector<Edge> restoredEdges;
};

/// Remove a node together with every edge incident to it.
/// `cascadedEdges` must list exactly those edges or the store rejects it.
struct DeleteNodeRecord {
    Node node;
    std::vector<Edge> cascadedEdges;
};

/// Replace a node's full state
struct UpdateNodeRecord {
    Node before;
    Node after;
};

/// Position change. Coalesced during a drag: `from` is the drag start,
/// `to` the latest position.
struct MoveNodeRecord {
    NodeId id = INVALID_NODE;
    Point from;
    Point to;
    Timestamp fromUpdatedAt = 0;
    Timestamp toUpdatedAt = 0;
};

struct CreateEdgeRecord {
    Edge edge;
};

struct DeleteEdgeRecord {
    Edge edge;
};

struct UpdateEdgeRecord {
    Edge before;
    Edge after;
};

enum class MutationKind {
    CreateNode,
    DeleteNode,
    UpdateNode,
    MoveNode,
    CreateEdge,
    DeleteEdge,
    UpdateEdge
};

const char* mutationKindToString(MutationKind kind);

/// One user-visible graph mutation, carrying enough state to be inverted.
///
/// GraphStore applies records, MutationLog stacks them. Undo applies
/// `record.inverse()`, redo applies the record again. Because records carry
/// full before/after entities (timestamps included), undo followed by redo
/// restores a bit-identical graph.
class MutationRecord {
public:
    using Payload = std::variant<CreateNodeRecord, DeleteNodeRecord, UpdateNodeRecord,
                                 MoveNodeRecord, CreateEdgeRecord, DeleteEdgeRecord,
                                 UpdateEdgeRecord>;

    MutationRecord(Payload payload) : payload_(std::move(payload)) {}  // NOLINT(implicit)

    static MutationRecord createNode(Node node, std::vector<Edge> restoredEdges = {});
    static MutationRecord deleteNode(Node node, std::vector<Edge> cascadedEdges);
    static MutationRecord updateNode(Node before, Node after);
    static MutationRecord moveNode(NodeId id, Point from, Point to,
                                   Timestamp fromUpdatedAt, Timestamp toUpdatedAt);
    static MutationRecord createEdge(Edge edge);
    static MutationRecord deleteEdge(Edge edge);
    static MutationRecord updateEdge(Edge before, Edge after);

    MutationKind kind() const;

    /// Node or edge id this record is about (the node for node records)
    uint64_t targetId() const;

    /// The record that reverts this one
    MutationRecord inverse() const;

    /// Every entity whose stored state changes when this record is applied
    /// (or inverted): the node plus cascaded/restored edges for node deletes.
    std::vector<EntityRef> affectedEntities() const;

    /// Same kind, same target, and a kind that supports merging
    /// (moves and updates; creates and deletes never merge).
    bool canCoalesceWith(const MutationRecord& newer) const;

    /// Merge a newer record into this one: keep our "before", take its "after".
    /// Precondition: canCoalesceWith(newer).
    void coalesce(const MutationRecord& newer);

    const Payload& payload() const { return payload_; }

    template <typename T>
    const T* as() const { return std::get_if<T>(&payload_); }

    std::string describe() const;

private:
    Payload payload_;
};

}  // namespace canvascore
