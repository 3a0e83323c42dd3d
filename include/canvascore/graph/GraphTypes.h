#pragma once

#include "canvascore/core/Types.h"

#include <optional>
#include <string>

namespace canvascore {

/// Opaque node content. The core stores and persists it but never looks inside;
/// the rendering collaborator interprets `kind` and `payload`.
struct NodeContent {
    std::string kind;     ///< Content-kind tag, e.g. "note" or "conversation"
    std::string payload;  ///< Serialized content owned by the renderer

    bool operator==(const NodeContent& o) const = default;
};

struct Node {
    NodeId id = INVALID_NODE;
    Point position;
    Size size;
    NodeContent content;
    std::optional<std::string> color;  ///< Color token, unset = theme default
    Timestamp createdAt = 0;           ///< Never regenerated after creation
    Timestamp updatedAt = 0;

    Rect bounds() const { return Rect(position, size); }

    bool operator==(const Node& o) const = default;
};

struct Edge {
    EdgeId id = INVALID_EDGE;
    NodeId source = INVALID_NODE;
    NodeId target = INVALID_NODE;
    std::optional<std::string> color;  ///< Unset = inherit the source node's color
    Timestamp createdAt = 0;           ///< Never regenerated after creation

    bool touches(NodeId node) const { return source == node || target == node; }

    bool operator==(const Edge& o) const = default;
};

/// Partial node update. Unset fields are left unchanged.
struct NodePatch {
    std::optional<Point> position;
    std::optional<Size> size;
    std::optional<NodeContent> content;
    std::optional<std::string> color;
    bool clearColor = false;  ///< Reset color to unset (wins over `color`)

    bool empty() const {
        return !position && !size && !content && !color && !clearColor;
    }
};

/// Partial edge update. Endpoints are fixed for the lifetime of an edge.
struct EdgePatch {
    std::optional<std::string> color;
    bool clearColor = false;

    bool empty() const { return !color && !clearColor; }
};

}  // namespace canvascore
