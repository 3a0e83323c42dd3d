#pragma once

#include "IoResult.h"
#include "canvascore/graph/GraphTypes.h"

#include <cstdint>
#include <vector>

namespace canvascore {

/// One flush worth of storage operations, written in a single transaction
struct WriteBatch {
    uint64_t sequence = 0;
    std::vector<Node> nodeUpserts;
    std::vector<Edge> edgeUpserts;
    std::vector<NodeId> nodeDeletes;
    std::vector<EdgeId> edgeDeletes;

    bool empty() const {
        return nodeUpserts.empty() && edgeUpserts.empty() &&
               nodeDeletes.empty() && edgeDeletes.empty();
    }

    size_t size() const {
        return nodeUpserts.size() + edgeUpserts.size() + nodeDeletes.size() + edgeDeletes.size();
    }
};

/// Raw rows as stored. Dangling edges are not filtered here.
struct LoadedRecords {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
};

/**
 * @brief Transactional record store keyed by entity id
 *
 * writeBatch() is called from the persistence worker thread; implementations
 * must tolerate that. Records are stored with both timestamps verbatim.
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    virtual IoResult open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /// Upserts and deletes by id, all or nothing
    virtual IoResult writeBatch(const WriteBatch& batch) = 0;

    virtual IoResult loadAll(LoadedRecords& out) = 0;
};

}  // namespace canvascore
