#pragma once

#include "canvascore/graph/GraphStore.h"
#include "canvascore/graph/MutationRecord.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

namespace canvascore {

struct HistoryConfig {
    size_t capacity = 200;            ///< Undo entries kept; oldest evicted first
    uint32_t coalesceWindowMs = 500;  ///< Max gap between merged records
};

/**
 * @brief Undo/redo stacks over a GraphStore
 *
 * The caller applies a mutation to the store first, then records it here.
 * undo() and redo() apply through the same store, so invariant checks cover
 * replayed mutations too. Both fail closed: if the store rejects the replay,
 * the stacks are left exactly as they were.
 *
 * Coalescing: a MoveNode/UpdateNode/UpdateEdge record for the same target as
 * the newest entry, arriving within the window, extends that entry instead of
 * pushing a new one. A whole drag therefore undoes in one step. Undo, redo and
 * breakCoalescing() (drag end) close the newest entry.
 */
class MutationLog {
public:
    /// Called with every record that undo()/redo() applied to the store
    using AppliedCallback = std::function<void(const MutationRecord& applied)>;

    explicit MutationLog(GraphStore& store, HistoryConfig config = {});

    /// Push an already-applied mutation. Clears the redo stack.
    /// @return true if merged into the newest entry
    bool record(const MutationRecord& record, uint64_t nowMs);

    bool undo();
    bool redo();

    bool canUndo() const { return !undoStack_.empty(); }
    bool canRedo() const { return !redoStack_.empty(); }
    size_t undoCount() const { return undoStack_.size(); }
    size_t redoCount() const { return redoStack_.size(); }

    /// Stop merging into the newest entry
    void breakCoalescing() { coalesceOpen_ = false; }

    void clear();

    const MutationRecord* peekUndo() const;
    const MutationRecord* peekRedo() const;

    void setAppliedCallback(AppliedCallback callback) { appliedCallback_ = std::move(callback); }

    const HistoryConfig& config() const { return config_; }

private:
    GraphStore& store_;
    HistoryConfig config_;

    std::deque<MutationRecord> undoStack_;
    std::vector<MutationRecord> redoStack_;

    bool coalesceOpen_ = false;
    uint64_t lastRecordMs_ = 0;

    AppliedCallback appliedCallback_;
};

}  // namespace canvascore
