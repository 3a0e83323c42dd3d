#include "canvascore/persistence/PersistenceCoordinator.h"
#include "canvascore/common/Logger.h"

namespace canvascore {

PersistenceCoordinator::PersistenceCoordinator(
    const GraphStore& graph,
    std::shared_ptr<IRecordStore> records,
    std::shared_ptr<ITaskExecutor> executor,
    PersistenceConfig config)
    : graph_(graph)
    , records_(std::move(records))
    , executor_(executor ? std::move(executor) : std::make_shared<SerialTaskExecutor>())
    , config_(std::move(config))
    , completions_(std::make_shared<CompletionQueue>())
{
}

// === Scheduling ===

void PersistenceCoordinator::arm(uint64_t nowMs) {
    if (!firstScheduledMs_) {
        firstScheduledMs_ = nowMs;
    }
    lastScheduledMs_ = nowMs;
}

void PersistenceCoordinator::scheduleWrite(EntityRef ref, uint64_t nowMs) {
    if (ref.kind == EntityKind::Node) {
        pendingNodes_.insert(ref.id);
    } else {
        pendingEdges_.insert(ref.id);
    }
    lastNowMs_ = nowMs;
    arm(nowMs);
}

void PersistenceCoordinator::scheduleWrites(const std::vector<EntityRef>& refs, uint64_t nowMs) {
    for (const auto& ref : refs) {
        scheduleWrite(ref, nowMs);
    }
}

bool PersistenceCoordinator::isPending(EntityRef ref) const {
    if (ref.kind == EntityKind::Node) {
        return pendingNodes_.count(ref.id) > 0;
    }
    return pendingEdges_.count(ref.id) > 0;
}

void PersistenceCoordinator::update(uint64_t nowMs) {
    lastNowMs_ = nowMs;
    processCompletions();

    if (pendingCount() == 0) {
        return;
    }
    if (!lastScheduledMs_) {
        arm(nowMs);
    }

    uint64_t sinceLast = nowMs > *lastScheduledMs_ ? nowMs - *lastScheduledMs_ : 0;
    uint64_t sinceFirst = nowMs > *firstScheduledMs_ ? nowMs - *firstScheduledMs_ : 0;
    if (sinceLast < config_.debounceMs && sinceFirst < config_.maxDeferMs) {
        return;
    }

    IoResult submitted = flush();
    if (!submitted) {
        LOG_DEBUG("debounced flush not submitted: {}", submitted.toString());
    }
}

// === Flushing ===

WriteBatch PersistenceCoordinator::buildBatch() const {
    WriteBatch batch;
    for (NodeId id : pendingNodes_) {
        if (const Node* node = graph_.findNode(id)) {
            batch.nodeUpserts.push_back(*node);
        } else {
            batch.nodeDeletes.push_back(id);
        }
    }
    for (EdgeId id : pendingEdges_) {
        if (const Edge* edge = graph_.findEdge(id)) {
            batch.edgeUpserts.push_back(*edge);
        } else {
            batch.edgeDeletes.push_back(id);
        }
    }
    return batch;
}

IoResult PersistenceCoordinator::flush() {
    if (pendingCount() == 0) {
        return IoResult::success();
    }

    WriteBatch batch = buildBatch();
    batch.sequence = nextSequence_++;

    std::vector<NodeId> nodes(pendingNodes_.begin(), pendingNodes_.end());
    std::vector<EdgeId> edges(pendingEdges_.begin(), pendingEdges_.end());
    pendingNodes_.clear();
    pendingEdges_.clear();
    firstScheduledMs_.reset();
    lastScheduledMs_.reset();

    LOG_DEBUG("flushing batch {}: {} node upserts, {} edge upserts, {} node deletes, {} edge deletes",
              batch.sequence, batch.nodeUpserts.size(), batch.edgeUpserts.size(),
              batch.nodeDeletes.size(), batch.edgeDeletes.size());

    ++inFlight_;
    auto records = records_;
    auto queue = completions_;
    bool submitted = executor_->submit([records, queue, batch, nodes, edges]() {
        Completion completion;
        completion.sequence = batch.sequence;
        completion.result = records->writeBatch(batch);
        completion.nodes = nodes;
        completion.edges = edges;
        {
            std::lock_guard<std::mutex> lock(queue->mutex);
            queue->items.push_back(std::move(completion));
        }
        queue->cv.notify_all();
    });

    if (!submitted) {
        --inFlight_;
        pendingNodes_.insert(nodes.begin(), nodes.end());
        pendingEdges_.insert(edges.begin(), edges.end());
        arm(lastNowMs_);
        IoResult error = IoResult::fail(IoErrorCode::Closed, "persistence worker is not running");
        LOG_ERROR("batch {} not submitted, {} entities stay pending",
                  batch.sequence, nodes.size() + edges.size());
        reportError(error);
        return error;
    }
    return IoResult::success();
}

void PersistenceCoordinator::waitForInFlight() {
    std::unique_lock<std::mutex> lock(completions_->mutex);
    completions_->cv.wait(lock, [this] { return completions_->items.size() >= inFlight_; });
}

size_t PersistenceCoordinator::processCompletions() {
    std::vector<Completion> done;
    {
        std::lock_guard<std::mutex> lock(completions_->mutex);
        done.swap(completions_->items);
    }

    for (auto& completion : done) {
        --inFlight_;
        if (completion.result) {
            ++completedBatches_;
            LOG_DEBUG("batch {} written", completion.sequence);
            continue;
        }

        // Keep the entities pending; the next flush reads their latest state
        ++failedBatches_;
        pendingNodes_.insert(completion.nodes.begin(), completion.nodes.end());
        pendingEdges_.insert(completion.edges.begin(), completion.edges.end());
        arm(lastNowMs_);
        LOG_ERROR("batch {} failed, {} entities stay pending: {}",
                  completion.sequence, completion.nodes.size() + completion.edges.size(),
                  completion.result.toString());
        reportError(completion.result);
    }
    return done.size();
}

IoResult PersistenceCoordinator::flushAndWait() {
    for (uint32_t attempt = 0;; ++attempt) {
        waitForInFlight();
        processCompletions();

        if (pendingCount() == 0) {
            LOG_INFO("all writes durable ({} batches)", completedBatches_);
            return IoResult::success();
        }
        if (attempt > config_.shutdownRetryLimit) {
            LOG_ERROR("giving up with {} unsaved entities after {} attempts",
                      pendingCount(), attempt);
            return lastError_.value_or(
                IoResult::fail(IoErrorCode::TransactionFailed, "writes still pending"));
        }
        if (attempt > 0) {
            LOG_WARN("retrying {} pending writes (attempt {})", pendingCount(), attempt + 1);
        }

        IoResult submitted = flush();
        if (!submitted) {
            return submitted;
        }
    }
}

void PersistenceCoordinator::reportError(const IoResult& error) {
    lastError_ = error;
    if (errorCallback_) {
        errorCallback_(error);
    }
}

}  // namespace canvascore
