#pragma once

#include "IRecordStore.h"
#include "IoResult.h"
#include "canvascore/core/TaskExecutor.h"
#include "canvascore/core/Types.h"
#include "canvascore/graph/GraphStore.h"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace canvascore {

/// Default quiet period before pending writes are flushed (milliseconds)
constexpr uint32_t DEFAULT_WRITE_DEBOUNCE_MS = 300;

struct PersistenceConfig {
    uint32_t debounceMs = DEFAULT_WRITE_DEBOUNCE_MS;
    uint32_t maxDeferMs = 2000;        ///< Flush even if scheduling never goes quiet
    uint32_t shutdownRetryLimit = 3;   ///< Extra flush attempts in flushAndWait()
    std::string databasePath = "canvas.db";
};

/**
 * @brief Debounced, batched write path from GraphStore to an IRecordStore
 *
 * scheduleWrite() only records *which* entity is dirty. When the debounce
 * expires, flush() reads the entity's current state from the GraphStore:
 * present entities are upserted, missing ones deleted. Fifty moves of one
 * node therefore produce a single write of its final position.
 *
 * Time is supplied by the caller through update(nowMs), like other polled
 * coordinators on the interaction thread:
 * @code
 * persistence.scheduleWrite(EntityRef::node(id), clock.steadyTimeMs());
 * // every frame
 * persistence.update(clock.steadyTimeMs());
 * @endcode
 *
 * Disk I/O runs on the executor. Completions are queued and handled on the
 * interaction thread by processCompletions() (called from update()).
 * A failed batch puts its entities back into the pending set, reports the
 * error through the callback, and is retried after the next debounce.
 */
class PersistenceCoordinator {
public:
    using ErrorCallback = std::function<void(const IoResult& error)>;

    PersistenceCoordinator(const GraphStore& graph,
                           std::shared_ptr<IRecordStore> records,
                           std::shared_ptr<ITaskExecutor> executor,
                           PersistenceConfig config = {});

    PersistenceCoordinator(const PersistenceCoordinator&) = delete;
    PersistenceCoordinator& operator=(const PersistenceCoordinator&) = delete;

    // =========================================================================
    // Scheduling
    // =========================================================================

    /// Mark an entity dirty and re-arm the debounce
    void scheduleWrite(EntityRef ref, uint64_t nowMs);
    void scheduleWrites(const std::vector<EntityRef>& refs, uint64_t nowMs);

    /// Handle completions and flush once the debounce (or max deferral) expired
    void update(uint64_t nowMs);

    // =========================================================================
    // Flushing
    // =========================================================================

    /// Submit all pending entities as one batch now
    /// @return Submission result; the write outcome arrives via processCompletions()
    IoResult flush();

    /**
     * @brief Block until every pending entity is durably written
     *
     * Shutdown only. Failed batches are retried up to shutdownRetryLimit times;
     * if entities are still pending after that, the last error is returned.
     */
    IoResult flushAndWait();

    /// Apply finished batch results. Returns the number of batches handled.
    size_t processCompletions();

    // =========================================================================
    // State
    // =========================================================================

    size_t pendingCount() const { return pendingNodes_.size() + pendingEdges_.size(); }
    bool isPending(EntityRef ref) const;
    size_t inFlightCount() const { return inFlight_; }
    bool isIdle() const { return pendingCount() == 0 && inFlight_ == 0; }

    uint64_t completedBatches() const { return completedBatches_; }
    uint64_t failedBatches() const { return failedBatches_; }
    const std::optional<IoResult>& lastError() const { return lastError_; }

    void setErrorCallback(ErrorCallback callback) { errorCallback_ = std::move(callback); }

    const PersistenceConfig& config() const { return config_; }

private:
    struct Completion {
        uint64_t sequence = 0;
        IoResult result;
        std::vector<NodeId> nodes;
        std::vector<EdgeId> edges;
    };

    /// Shared with worker tasks so they never touch the coordinator itself
    struct CompletionQueue {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<Completion> items;
    };

    WriteBatch buildBatch() const;
    void waitForInFlight();
    void reportError(const IoResult& error);
    void arm(uint64_t nowMs);

    const GraphStore& graph_;
    std::shared_ptr<IRecordStore> records_;
    std::shared_ptr<ITaskExecutor> executor_;
    PersistenceConfig config_;

    std::set<NodeId> pendingNodes_;
    std::set<EdgeId> pendingEdges_;
    std::optional<uint64_t> firstScheduledMs_;
    std::optional<uint64_t> lastScheduledMs_;
    uint64_t lastNowMs_ = 0;

    std::shared_ptr<CompletionQueue> completions_;
    size_t inFlight_ = 0;
    uint64_t nextSequence_ = 1;
    uint64_t completedBatches_ = 0;
    uint64_t failedBatches_ = 0;

    std::optional<IoResult> lastError_;
    ErrorCallback errorCallback_;
};

}  // namespace canvascore
