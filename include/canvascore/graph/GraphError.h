#pragma once

#include <cstdint>
#include <string>

namespace canvascore {

/// Invariant violations that make GraphStore reject a mutation
enum class GraphError {
    None,
    DuplicateId,       ///< Entity with this id already exists
    NodeNotFound,
    EdgeNotFound,
    MissingEndpoint,   ///< Edge endpoint does not resolve to a node
    SelfLoop,          ///< Edge source equals target
    CascadeMismatch,   ///< Delete record does not list exactly the incident edges
    StaleRecord,       ///< Record's "before" state differs from the current state
    InvalidSize,       ///< Node size outside configured limits
    CapacityExceeded   ///< Node or edge count limit reached
};

const char* graphErrorToString(GraphError error);

/// Outcome of GraphStore::apply(). A failed apply leaves the graph untouched.
struct ApplyResult {
    bool ok = true;
    GraphError error = GraphError::None;
    std::string message;
    uint64_t version = 0;  ///< Graph version after the call

    static ApplyResult success(uint64_t version) { return {true, GraphError::None, "", version}; }

    static ApplyResult fail(GraphError error, const std::string& message, uint64_t version = 0) {
        return {false, error, message, version};
    }

    explicit operator bool() const { return ok; }

    std::string toString() const;
};

}  // namespace canvascore
