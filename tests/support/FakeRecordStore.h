#pragma once

#include <canvascore/persistence/IRecordStore.h>

#include <map>
#include <mutex>
#include <vector>

namespace canvascore::test {

/// In-memory IRecordStore that counts writes and can be told to fail
class FakeRecordStore : public IRecordStore {
public:
    IoResult open() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failOpen_) {
            return IoResult::fail(IoErrorCode::OpenFailed, "open refused");
        }
        open_ = true;
        return IoResult::success();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    IoResult writeBatch(const WriteBatch& batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++writeAttempts_;
        if (failWrites_ > 0) {
            --failWrites_;
            return IoResult::fail(IoErrorCode::TransactionFailed, "disk full");
        }
        if (!open_) {
            return IoResult::fail(IoErrorCode::Closed, "database is not open");
        }
        batches_.push_back(batch);
        for (EdgeId id : batch.edgeDeletes) edges_.erase(id);
        for (NodeId id : batch.nodeDeletes) nodes_.erase(id);
        for (const auto& node : batch.nodeUpserts) nodes_[node.id] = node;
        for (const auto& edge : batch.edgeUpserts) edges_[edge.id] = edge;
        return IoResult::success();
    }

    IoResult loadAll(LoadedRecords& out) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out.nodes.clear();
        out.edges.clear();
        for (const auto& [id, node] : nodes_) out.nodes.push_back(node);
        for (const auto& [id, edge] : edges_) out.edges.push_back(edge);
        return IoResult::success();
    }

    /// Fail the next `count` writeBatch() calls
    void failNextWrites(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failWrites_ = count;
    }

    void setFailOpen(bool fail) { failOpen_ = fail; }

    /// Seed rows directly, bypassing any validation
    void seedNode(const Node& node) { nodes_[node.id] = node; }
    void seedEdge(const Edge& edge) { edges_[edge.id] = edge; }

    std::vector<WriteBatch> batches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return batches_;
    }

    int writeAttempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writeAttempts_;
    }

    std::map<NodeId, Node> nodes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return nodes_;
    }

    std::map<EdgeId, Edge> edges() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return edges_;
    }

private:
    mutable std::mutex mutex_;
    bool open_ = false;
    bool failOpen_ = false;
    int failWrites_ = 0;
    int writeAttempts_ = 0;
    std::vector<WriteBatch> batches_;
    std::map<NodeId, Node> nodes_;
    std::map<EdgeId, Edge> edges_;
};

}  // namespace canvascore::test
