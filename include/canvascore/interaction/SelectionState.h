#pragma once

#include "canvascore/core/Types.h"

#include <optional>

namespace canvascore {

/**
 * @brief Current node selection and modal exclusivity
 *
 * Changed only by explicit user actions and modal open/close, and read
 * synchronously by the EventRouter. While any modal is open the selection
 * behaves as empty for routing (effectiveSelection()), even though the
 * underlying selection is kept for when the modal closes.
 */
class SelectionState {
public:
    void select(NodeId id);
    void clearSelection();

    std::optional<NodeId> currentSelection() const { return selection_; }

    /// Selection as the router sees it: empty while a modal is open
    std::optional<NodeId> effectiveSelection() const;

    bool isSelected(NodeId id) const { return selection_ && *selection_ == id; }

    /// Modals nest; input is captured until every beginModal() is matched
    void beginModal();
    void endModal();

    bool isModalActive() const { return modalDepth_ > 0; }
    int modalDepth() const { return modalDepth_; }

    /// Drop the selection if it points at a node that no longer exists
    void onNodeRemoved(NodeId id);

private:
    std::optional<NodeId> selection_;
    int modalDepth_ = 0;
};

}  // namespace canvascore
