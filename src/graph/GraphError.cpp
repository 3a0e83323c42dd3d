#include "canvascore/graph/GraphError.h"

namespace canvascore {

const char* graphErrorToString(GraphError error) {
    switch (error) {
        case GraphError::None: return "None";
        case GraphError::DuplicateId: return "DuplicateId";
        case GraphError::NodeNotFound: return "NodeNotFound";
        case GraphError::EdgeNotFound: return "EdgeNotFound";
        case GraphError::MissingEndpoint: return "MissingEndpoint";
        case GraphError::SelfLoop: return "SelfLoop";
        case GraphError::CascadeMismatch: return "CascadeMismatch";
        case GraphError::StaleRecord: return "StaleRecord";
        case GraphError::InvalidSize: return "InvalidSize";
        case GraphError::CapacityExceeded: return "CapacityExceeded";
    }
    return "Unknown";
}

std::string ApplyResult::toString() const {
    if (ok) {
        return "ok (version " + std::to_string(version) + ")";
    }
    return std::string(graphErrorToString(error)) + ": " + message;
}

}  // namespace canvascore
