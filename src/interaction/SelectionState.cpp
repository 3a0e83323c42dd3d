#include "canvascore/interaction/SelectionState.h"
#include "canvascore/common/Logger.h"

namespace canvascore {

void SelectionState::select(NodeId id) {
    if (id == INVALID_NODE) {
        clearSelection();
        return;
    }
    selection_ = id;
}

void SelectionState::clearSelection() {
    selection_.reset();
}

std::optional<NodeId> SelectionState::effectiveSelection() const {
    if (isModalActive()) {
        return std::nullopt;
    }
    return selection_;
}

void SelectionState::beginModal() {
    ++modalDepth_;
    LOG_DEBUG("modal opened (depth {})", modalDepth_);
}

void SelectionState::endModal() {
    if (modalDepth_ == 0) {
        LOG_WARN("endModal() without matching beginModal()");
        return;
    }
    --modalDepth_;
    LOG_DEBUG("modal closed (depth {})", modalDepth_);
}

void SelectionState::onNodeRemoved(NodeId id) {
    if (isSelected(id)) {
        selection_.reset();
    }
}

}  // namespace canvascore
