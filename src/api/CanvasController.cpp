#include "canvascore/api/CanvasController.h"
#include "canvascore/common/Logger.h"
#include "canvascore/persistence/GraphSerializer.h"
#include "canvascore/persistence/SqliteRecordStore.h"

namespace canvascore {

CanvasController::CanvasController(CanvasConfig config,
                                   std::shared_ptr<IRecordStore> records,
                                   std::shared_ptr<ITaskExecutor> executor,
                                   std::shared_ptr<IClock> clock)
    : config_(std::move(config))
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
    , records_(records ? std::move(records)
                       : std::make_shared<SqliteRecordStore>(config_.persistence.databasePath))
    , ownsExecutor_(!executor)
    , executor_(executor ? std::move(executor) : std::make_shared<SerialTaskExecutor>())
    , graph_(config_.graph)
    , history_(graph_, config_.history)
    , persistence_(graph_, records_, executor_, config_.persistence)
    , surfaces_(graph_)
    , viewport_(config_.viewport)
    , router_(selection_, surfaces_, viewport_, config_.routing)
{
    Logger::initialize(config_.logging.logDir, config_.logging.logToFile);
    Logger::setLevel(config_.logging.level);

    for (const auto& problem : config_.validate()) {
        LOG_WARN("config: {}", problem);
    }

    history_.setAppliedCallback([this](const MutationRecord& applied) {
        afterApplied(applied, clock_->steadyTimeMs());
    });
    persistence_.setErrorCallback([this](const IoResult& error) {
        reportError("Changes could not be saved: " + error.message);
    });
}

CanvasController::~CanvasController() {
    if (open_) {
        IoResult result = close();
        if (!result) {
            LOG_ERROR("closing canvas lost pending writes: {}", result.toString());
        }
    }
    if (ownsExecutor_ && executor_) {
        executor_->shutdown();
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

IoResult CanvasController::open() {
    if (open_) {
        return IoResult::success();
    }

    IoResult opened = records_->open();
    if (!opened) {
        reportError("Canvas could not be opened: " + opened.message);
        return opened;
    }

    LoadedRecords loaded;
    IoResult read = records_->loadAll(loaded);
    if (!read) {
        reportError("Canvas could not be loaded: " + read.message);
        records_->close();
        return read;
    }

    replaceGraph(std::move(loaded.nodes), std::move(loaded.edges));
    open_ = true;
    return IoResult::success();
}

IoResult CanvasController::close() {
    if (!open_) {
        return IoResult::success();
    }

    history_.breakCoalescing();
    IoResult result = persistence_.flushAndWait();
    if (!result) {
        reportError("Changes could not be saved before closing: " + result.message);
    }
    records_->close();
    open_ = false;
    Logger::flush();
    return result;
}

IoResult CanvasController::save() {
    persistence_.processCompletions();
    IoResult result = persistence_.flush();
    if (!result) {
        LOG_WARN("manual save not submitted: {}", result.toString());
    }
    return result;
}

void CanvasController::update() {
    update(clock_->steadyTimeMs());
}

void CanvasController::update(uint64_t nowMs) {
    persistence_.update(nowMs);
}

void CanvasController::replaceGraph(std::vector<Node> nodes, std::vector<Edge> edges) {
    uint64_t now = clock_->steadyTimeMs();

    // Entities that disappear with the old graph must be deleted from storage
    auto previous = graph_.snapshot();
    LoadReport report = graph_.load(std::move(nodes), std::move(edges));

    for (EdgeId id : report.prunedEdges) {
        persistence_.scheduleWrite(EntityRef::edge(id), now);
    }
    auto current = graph_.snapshot();
    for (const auto& node : previous->nodes) {
        if (!current->findNode(node.id)) {
            persistence_.scheduleWrite(EntityRef::node(node.id), now);
        }
    }
    for (const auto& edge : previous->edges) {
        if (!current->findEdge(edge.id)) {
            persistence_.scheduleWrite(EntityRef::edge(edge.id), now);
        }
    }

    history_.clear();
    selection_.clearSelection();
    surfaces_.clear();
    router_.reset();
}

// =============================================================================
// Mutations
// =============================================================================

bool CanvasController::commit(const MutationRecord& record) {
    ApplyResult result = graph_.apply(record);
    if (!result) {
        return false;
    }
    uint64_t now = clock_->steadyTimeMs();
    history_.record(record, now);
    afterApplied(record, now);
    return true;
}

void CanvasController::afterApplied(const MutationRecord& record, uint64_t nowMs) {
    persistence_.scheduleWrites(record.affectedEntities(), nowMs);

    if (const auto* removed = record.as<DeleteNodeRecord>()) {
        selection_.onNodeRemoved(removed->node.id);
        surfaces_.onNodeRemoved(removed->node.id);
    }
}

NodeId CanvasController::createNode(Point position, std::string kind, std::string payload) {
    Timestamp now = clock_->wallTimeMs();

    Node node;
    node.id = graph_.allocateNodeId();
    node.position = position;
    node.size = config_.graph.defaultNodeSize;
    node.content = {std::move(kind), std::move(payload)};
    node.createdAt = now;
    node.updatedAt = now;

    NodeId id = node.id;
    if (!commit(MutationRecord::createNode(std::move(node)))) {
        return INVALID_NODE;
    }
    surfaces_.raise(id);
    return id;
}

NodeId CanvasController::duplicateNode(NodeId source, Point offset) {
    const Node* original = graph_.findNode(source);
    if (!original) {
        LOG_WARN("cannot duplicate missing node {}", source);
        return INVALID_NODE;
    }

    Timestamp now = clock_->wallTimeMs();
    Node copy = *original;
    copy.id = graph_.allocateNodeId();
    copy.position = original->position + offset;
    copy.createdAt = now;
    copy.updatedAt = now;

    NodeId id = copy.id;
    if (!commit(MutationRecord::createNode(std::move(copy)))) {
        return INVALID_NODE;
    }
    surfaces_.raise(id);
    return id;
}

bool CanvasController::updateNode(NodeId id, const NodePatch& patch) {
    const Node* current = graph_.findNode(id);
    if (!current) {
        LOG_WARN("cannot update missing node {}", id);
        return false;
    }
    if (patch.empty()) {
        return true;
    }

    Node before = *current;
    Node after = before;
    if (patch.position) after.position = *patch.position;
    if (patch.size) after.size = *patch.size;
    if (patch.content) after.content = *patch.content;
    if (patch.clearColor) {
        after.color.reset();
    } else if (patch.color) {
        after.color = *patch.color;
    }
    if (after == before) {
        return true;
    }
    after.updatedAt = clock_->wallTimeMs();

    return commit(MutationRecord::updateNode(std::move(before), std::move(after)));
}

bool CanvasController::resizeNode(NodeId id, Size size) {
    NodePatch patch;
    patch.size = size.clamped(config_.graph.minNodeSize, config_.graph.maxNodeSize);
    return updateNode(id, patch);
}

bool CanvasController::moveNode(NodeId id, Point position) {
    const Node* current = graph_.findNode(id);
    if (!current) {
        LOG_WARN("cannot move missing node {}", id);
        return false;
    }
    if (current->position == position) {
        return true;
    }
    return commit(MutationRecord::moveNode(id, current->position, position,
                                           current->updatedAt, clock_->wallTimeMs()));
}

void CanvasController::endDrag() {
    history_.breakCoalescing();
}

bool CanvasController::deleteNode(NodeId id) {
    const Node* current = graph_.findNode(id);
    if (!current) {
        LOG_WARN("cannot delete missing node {}", id);
        return false;
    }
    Node node = *current;
    return commit(MutationRecord::deleteNode(std::move(node), graph_.incidentEdges(id)));
}

EdgeId CanvasController::createEdge(NodeId source, NodeId target, std::optional<std::string> color) {
    Edge edge;
    edge.id = graph_.allocateEdgeId();
    edge.source = source;
    edge.target = target;
    edge.color = std::move(color);
    edge.createdAt = clock_->wallTimeMs();

    EdgeId id = edge.id;
    if (!commit(MutationRecord::createEdge(std::move(edge)))) {
        return INVALID_EDGE;
    }
    return id;
}

bool CanvasController::updateEdge(EdgeId id, const EdgePatch& patch) {
    const Edge* current = graph_.findEdge(id);
    if (!current) {
        LOG_WARN("cannot update missing edge {}", id);
        return false;
    }
    if (patch.empty()) {
        return true;
    }

    Edge before = *current;
    Edge after = before;
    if (patch.clearColor) {
        after.color.reset();
    } else if (patch.color) {
        after.color = *patch.color;
    }
    if (after == before) {
        return true;
    }
    return commit(MutationRecord::updateEdge(std::move(before), std::move(after)));
}

bool CanvasController::deleteEdge(EdgeId id) {
    const Edge* current = graph_.findEdge(id);
    if (!current) {
        LOG_WARN("cannot delete missing edge {}", id);
        return false;
    }
    Edge edge = *current;
    return commit(MutationRecord::deleteEdge(std::move(edge)));
}

bool CanvasController::undo() {
    return history_.undo();
}

bool CanvasController::redo() {
    return history_.redo();
}

// =============================================================================
// Selection, modals and input
// =============================================================================

void CanvasController::select(NodeId id) {
    if (!graph_.hasNode(id)) {
        LOG_WARN("cannot select missing node {}", id);
        return;
    }
    selection_.select(id);
    surfaces_.raise(id);
}

void CanvasController::clearSelection() {
    selection_.clearSelection();
}

void CanvasController::beginModal() {
    selection_.beginModal();
    router_.reset();
}

void CanvasController::endModal() {
    selection_.endModal();
}

RouteDecision CanvasController::handleInput(const InputEvent& event) {
    RouteDecision decision = router_.route(event);

    switch (decision.target) {
        case RouteTarget::Canvas:
            if (event.type == InputType::Scroll) {
                viewport_.pan(Point{0, 0} - event.delta);
            } else if (event.type == InputType::Magnify) {
                viewport_.magnify(event.screenPosition, event.magnification);
            }
            break;
        case RouteTarget::NodeScroll:
            surfaces_.scrollBy(decision.node, event.delta);
            break;
        case RouteTarget::Modal:
            break;
    }

    LOG_TRACE("{} event -> {}{}", static_cast<int>(event.type),
              routeTargetToString(decision.target), decision.fromLock ? " (locked)" : "");
    return decision;
}

// =============================================================================
// Read API and backup
// =============================================================================

std::optional<std::string> CanvasController::edgeColor(EdgeId id) const {
    const Edge* edge = graph_.findEdge(id);
    if (!edge) {
        return std::nullopt;
    }
    return graph_.effectiveEdgeColor(*edge);
}

bool CanvasController::exportBackup(const std::string& path) const {
    bool saved = GraphSerializer::saveToFile(*graph_.snapshot(), path);
    if (saved) {
        LOG_INFO("exported backup to {}", path);
    }
    return saved;
}

bool CanvasController::importBackup(const std::string& path) {
    LoadedRecords loaded;
    if (!GraphSerializer::loadFromFile(loaded, path)) {
        reportError("Backup could not be read: " + path);
        return false;
    }

    std::vector<EntityRef> imported;
    for (const auto& node : loaded.nodes) {
        imported.push_back(EntityRef::node(node.id));
    }
    for (const auto& edge : loaded.edges) {
        imported.push_back(EntityRef::edge(edge.id));
    }

    replaceGraph(std::move(loaded.nodes), std::move(loaded.edges));
    persistence_.scheduleWrites(imported, clock_->steadyTimeMs());
    LOG_INFO("imported backup {} ({} nodes, {} edges)",
             path, graph_.nodeCount(), graph_.edgeCount());
    return true;
}

void CanvasController::reportError(const std::string& message) {
    LOG_ERROR("{}", message);
    lastError_ = message;
    if (errorCallback_) {
        errorCallback_(message);
    }
}

}  // namespace canvascore
