#include "canvascore/history/MutationLog.h"
#include "canvascore/common/Logger.h"

namespace canvascore {

MutationLog::MutationLog(GraphStore& store, HistoryConfig config)
    : store_(store)
    , config_(config) {
    if (config_.capacity == 0) {
        config_.capacity = 1;
    }
}

bool MutationLog::record(const MutationRecord& record, uint64_t nowMs) {
    redoStack_.clear();

    bool withinWindow = nowMs >= lastRecordMs_ && nowMs - lastRecordMs_ <= config_.coalesceWindowMs;
    bool merged = false;
    if (coalesceOpen_ && withinWindow && !undoStack_.empty() &&
        undoStack_.back().canCoalesceWith(record)) {
        undoStack_.back().coalesce(record);
        merged = true;
    } else {
        undoStack_.push_back(record);
        // Entries are evicted whole, so a node delete never loses its edges
        while (undoStack_.size() > config_.capacity) {
            LOG_DEBUG("evicting {}", undoStack_.front().describe());
            undoStack_.pop_front();
        }
    }

    coalesceOpen_ = true;
    lastRecordMs_ = nowMs;
    return merged;
}

bool MutationLog::undo() {
    coalesceOpen_ = false;
    if (undoStack_.empty()) {
        return false;
    }

    MutationRecord inverse = undoStack_.back().inverse();
    ApplyResult result = store_.apply(inverse);
    if (!result) {
        LOG_ERROR("undo of {} failed: {}", undoStack_.back().describe(), result.toString());
        return false;
    }

    redoStack_.push_back(std::move(undoStack_.back()));
    undoStack_.pop_back();

    if (appliedCallback_) {
        appliedCallback_(inverse);
    }
    return true;
}

bool MutationLog::redo() {
    coalesceOpen_ = false;
    if (redoStack_.empty()) {
        return false;
    }

    const MutationRecord& next = redoStack_.back();
    ApplyResult result = store_.apply(next);
    if (!result) {
        LOG_ERROR("redo of {} failed: {}", next.describe(), result.toString());
        return false;
    }

    undoStack_.push_back(next);
    redoStack_.pop_back();

    if (appliedCallback_) {
        appliedCallback_(undoStack_.back());
    }
    return true;
}

void MutationLog::clear() {
    undoStack_.clear();
    redoStack_.clear();
    coalesceOpen_ = false;
}

const MutationRecord* MutationLog::peekUndo() const {
    return undoStack_.empty() ? nullptr : &undoStack_.back();
}

const MutationRecord* MutationLog::peekRedo() const {
    return redoStack_.empty() ? nullptr : &redoStack_.back();
}

}  // namespace canvascore
