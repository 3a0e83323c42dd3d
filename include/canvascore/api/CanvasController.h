#pragma once

#include "canvascore/config/CanvasConfig.h"
#include "canvascore/core/Clock.h"
#include "canvascore/core/TaskExecutor.h"
#include "canvascore/graph/GraphStore.h"
#include "canvascore/history/MutationLog.h"
#include "canvascore/interaction/CanvasViewport.h"
#include "canvascore/interaction/EventRouter.h"
#include "canvascore/interaction/InputEvent.h"
#include "canvascore/interaction/SelectionState.h"
#include "canvascore/interaction/SurfaceTree.h"
#include "canvascore/persistence/IRecordStore.h"
#include "canvascore/persistence/PersistenceCoordinator.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace canvascore {

/**
 * @brief Mutation and read API of one canvas
 *
 * Owns the graph, its history, the persistence path, selection and routing,
 * and keeps them consistent: every accepted mutation is applied to the
 * GraphStore, recorded in the MutationLog and scheduled for writing. Undo and
 * redo go through the same scheduling, so restored entities are persisted
 * like any other change.
 *
 * All calls belong to the interaction thread. Only close() blocks.
 *
 * @code
 * CanvasController canvas(config);
 * canvas.open();
 * NodeId a = canvas.createNode({0, 0}, "note");
 * NodeId b = canvas.createNode({100, 100}, "note");
 * canvas.createEdge(a, b);
 * // every frame
 * canvas.update();
 * // on quit
 * canvas.close();
 * @endcode
 */
class CanvasController {
public:
    /// User-visible error text (failed saves and loads)
    using ErrorCallback = std::function<void(const std::string& message)>;

    /// @param records Storage; defaults to a SqliteRecordStore at config.persistence.databasePath
    /// @param executor Worker for disk I/O; defaults to a SerialTaskExecutor
    /// @param clock Time source; defaults to SystemClock
    explicit CanvasController(CanvasConfig config = {},
                              std::shared_ptr<IRecordStore> records = nullptr,
                              std::shared_ptr<ITaskExecutor> executor = nullptr,
                              std::shared_ptr<IClock> clock = nullptr);
    ~CanvasController();

    CanvasController(const CanvasController&) = delete;
    CanvasController& operator=(const CanvasController&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Open storage and load the stored graph (dangling edges are pruned
    /// and their rows scheduled for deletion)
    IoResult open();

    /// Write everything pending and close storage. Blocks.
    IoResult close();

    bool isOpen() const { return open_; }

    /// Manual save: flush pending writes now instead of waiting for the debounce
    IoResult save();

    /// Per-frame tick: debounce expiry and write completions
    void update();
    void update(uint64_t nowMs);

    // =========================================================================
    // Mutations
    // =========================================================================

    /// @return New node id, or INVALID_NODE if rejected
    NodeId createNode(Point position, std::string kind, std::string payload = "");

    /// Copy a node's content and color to a new node at position + offset
    NodeId duplicateNode(NodeId source, Point offset = {40.0f, 40.0f});

    bool updateNode(NodeId id, const NodePatch& patch);

    /// Resize, clamping to the configured node size limits
    bool resizeNode(NodeId id, Size size);

    /// Move a node. Consecutive moves of one node merge into one undo step
    /// until endDrag(). A pause longer than the history coalesce window also
    /// ends the step, so a drag held still that long undoes in two steps.
    bool moveNode(NodeId id, Point position);
    void endDrag();

    /// Delete a node and all its edges as one undo step
    bool deleteNode(NodeId id);

    /// @return New edge id, or INVALID_EDGE if rejected
    EdgeId createEdge(NodeId source, NodeId target,
                      std::optional<std::string> color = std::nullopt);
    bool updateEdge(EdgeId id, const EdgePatch& patch);
    bool deleteEdge(EdgeId id);

    bool undo();
    bool redo();
    bool canUndo() const { return history_.canUndo(); }
    bool canRedo() const { return history_.canRedo(); }

    // =========================================================================
    // Selection, modals and input
    // =========================================================================

    void select(NodeId id);
    void clearSelection();
    std::optional<NodeId> selection() const { return selection_.currentSelection(); }

    void beginModal();
    void endModal();
    bool isModalActive() const { return selection_.isModalActive(); }

    /// Route an event and deliver it to the canvas transform or a node's
    /// scroll region. Modal-bound events are returned untouched for the host.
    RouteDecision handleInput(const InputEvent& event);

    // =========================================================================
    // Read API
    // =========================================================================

    std::shared_ptr<const GraphSnapshot> snapshot() const { return graph_.snapshot(); }
    uint64_t version() const { return graph_.version(); }

    /// Color an edge is drawn with (own color, else its source node's)
    std::optional<std::string> edgeColor(EdgeId id) const;

    // =========================================================================
    // Backup
    // =========================================================================

    bool exportBackup(const std::string& path) const;

    /// Replace the graph with a backup. Clears history; persisted like any change.
    bool importBackup(const std::string& path);

    // =========================================================================
    // Errors
    // =========================================================================

    void setErrorCallback(ErrorCallback callback) { errorCallback_ = std::move(callback); }
    const std::optional<std::string>& lastError() const { return lastError_; }

    // =========================================================================
    // Components
    // =========================================================================

    const GraphStore& graph() const { return graph_; }
    const MutationLog& history() const { return history_; }
    const PersistenceCoordinator& persistence() const { return persistence_; }
    SurfaceTree& surfaces() { return surfaces_; }
    const CanvasViewport& viewport() const { return viewport_; }
    const EventRouter& router() const { return router_; }
    const CanvasConfig& config() const { return config_; }

private:
    bool commit(const MutationRecord& record);
    void afterApplied(const MutationRecord& record, uint64_t nowMs);
    void replaceGraph(std::vector<Node> nodes, std::vector<Edge> edges);
    void reportError(const std::string& message);

    CanvasConfig config_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IRecordStore> records_;
    bool ownsExecutor_ = false;
    std::shared_ptr<ITaskExecutor> executor_;

    GraphStore graph_;
    MutationLog history_;
    PersistenceCoordinator persistence_;
    SelectionState selection_;
    SurfaceTree surfaces_;
    CanvasViewport viewport_;
    EventRouter router_;

    bool open_ = false;
    std::optional<std::string> lastError_;
    ErrorCallback errorCallback_;
};

}  // namespace canvascore
