#include <gtest/gtest.h>
#include <canvascore/common/Logger.h>
#include <canvascore/persistence/PersistenceCoordinator.h>
#include "support/FakeRecordStore.h"

using namespace canvascore;
using canvascore::test::FakeRecordStore;

class PersistenceCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::enableCapture(true);
        Logger::clearCapturedLogs();

        records_ = std::make_shared<FakeRecordStore>();
        ASSERT_TRUE(records_->open());
        executor_ = std::make_shared<InlineTaskExecutor>();
        coordinator_ = std::make_unique<PersistenceCoordinator>(graph_, records_, executor_);
        coordinator_->setErrorCallback([this](const IoResult& error) { errors_.push_back(error); });

        Node node;
        node.id = graph_.allocateNodeId();
        node.size = {400, 160};
        node.createdAt = 1;
        node.updatedAt = 1;
        ASSERT_TRUE(graph_.apply(MutationRecord::createNode(node)));
        nodeId_ = node.id;
    }

    void TearDown() override {
        Logger::enableCapture(false);
    }

    void moveTo(Point to, Timestamp updatedAt) {
        const Node* node = graph_.findNode(nodeId_);
        ASSERT_TRUE(graph_.apply(
            MutationRecord::moveNode(nodeId_, node->position, to, node->updatedAt, updatedAt)));
    }

    GraphStore graph_;
    std::shared_ptr<FakeRecordStore> records_;
    std::shared_ptr<InlineTaskExecutor> executor_;
    std::unique_ptr<PersistenceCoordinator> coordinator_;
    std::vector<IoResult> errors_;
    NodeId nodeId_ = INVALID_NODE;
};

TEST_F(PersistenceCoordinatorTest, NothingWrittenBeforeDebounce) {
    coordinator_->scheduleWrite(EntityRef::node(nodeId_), 1000);
    coordinator_->update(1000 + DEFAULT_WRITE_DEBOUNCE_MS - 1);

    EXPECT_EQ(records_->writeAttempts(), 0);
    EXPECT_TRUE(coordinator_->isPending(EntityRef::node(nodeId_)));
}

TEST_F(PersistenceCoordinatorTest, BurstOfMovesProducesOneWriteOfFinalState) {
    uint64_t now = 1000;
    for (int i = 1; i <= 50; ++i) {
        moveTo({static_cast<float>(i), static_cast<float>(i)}, 100 + i);
        coordinator_->scheduleWrite(EntityRef::node(nodeId_), now);
        coordinator_->update(now);
        now += 5;  // 50 moves inside 250ms
    }
    EXPECT_EQ(records_->writeAttempts(), 0);

    coordinator_->update(now + DEFAULT_WRITE_DEBOUNCE_MS);
    coordinator_->update(now + DEFAULT_WRITE_DEBOUNCE_MS + 1);

    ASSERT_EQ(records_->batches().size(), 1u);
    WriteBatch batch = records_->batches()[0];
    ASSERT_EQ(batch.nodeUpserts.size(), 1u);
    EXPECT_EQ(batch.nodeUpserts[0].position, Point(50, 50));
    EXPECT_EQ(records_->nodes().at(nodeId_).updatedAt, 150);
    EXPECT_TRUE(coordinator_->isIdle());
    EXPECT_EQ(coordinator_->completedBatches(), 1u);
}

TEST_F(PersistenceCoordinatorTest, ContinuousSchedulingFlushesAtMaxDefer) {
    uint64_t start = 1000;
    uint64_t now = start;
    while (now < start + coordinator_->config().maxDeferMs) {
        coordinator_->scheduleWrite(EntityRef::node(nodeId_), now);
        coordinator_->update(now);
        now += 100;
    }
    EXPECT_EQ(records_->writeAttempts(), 0);

    coordinator_->scheduleWrite(EntityRef::node(nodeId_), now);
    coordinator_->update(now);

    EXPECT_EQ(records_->writeAttempts(), 1);
}

TEST_F(PersistenceCoordinatorTest, MissingEntityBecomesDelete) {
    coordinator_->scheduleWrite(EntityRef::edge(77), 0);
    coordinator_->scheduleWrite(EntityRef::node(999), 0);
    ASSERT_TRUE(coordinator_->flush());

    ASSERT_EQ(records_->batches().size(), 1u);
    WriteBatch batch = records_->batches()[0];
    EXPECT_EQ(batch.edgeDeletes, std::vector<EdgeId>{77});
    EXPECT_EQ(batch.nodeDeletes, std::vector<NodeId>{999});
    EXPECT_TRUE(batch.nodeUpserts.empty());
}

TEST_F(PersistenceCoordinatorTest, FailedBatchStaysPendingAndIsRetried) {
    records_->failNextWrites(1);
    coordinator_->scheduleWrite(EntityRef::node(nodeId_), 1000);
    coordinator_->update(1400);   // flush fails
    coordinator_->update(1401);   // completion handled

    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].code, IoErrorCode::TransactionFailed);
    EXPECT_TRUE(coordinator_->isPending(EntityRef::node(nodeId_)));
    EXPECT_EQ(coordinator_->failedBatches(), 1u);
    EXPECT_FALSE(Logger::getCapturedLogs("[error]").empty());

    // Node changed while the failed batch was out; the retry carries the new state
    moveTo({9, 9}, 500);
    coordinator_->update(1401 + DEFAULT_WRITE_DEBOUNCE_MS);
    coordinator_->update(1402 + DEFAULT_WRITE_DEBOUNCE_MS);

    EXPECT_EQ(records_->writeAttempts(), 2);
    EXPECT_EQ(records_->nodes().at(nodeId_).position, Point(9, 9));
    EXPECT_TRUE(coordinator_->isIdle());
}

TEST_F(PersistenceCoordinatorTest, FlushAndWaitRetriesTransientFailures) {
    records_->failNextWrites(2);
    coordinator_->scheduleWrite(EntityRef::node(nodeId_), 0);

    IoResult result = coordinator_->flushAndWait();

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(records_->writeAttempts(), 3);
    EXPECT_TRUE(coordinator_->isIdle());
    EXPECT_EQ(records_->nodes().count(nodeId_), 1u);
}

TEST_F(PersistenceCoordinatorTest, FlushAndWaitGivesUpAfterRetryLimit) {
    records_->failNextWrites(100);
    coordinator_->scheduleWrite(EntityRef::node(nodeId_), 0);

    IoResult result = coordinator_->flushAndWait();

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.code, IoErrorCode::TransactionFailed);
    EXPECT_EQ(records_->writeAttempts(),
              static_cast<int>(coordinator_->config().shutdownRetryLimit) + 1);
    EXPECT_EQ(coordinator_->pendingCount(), 1u);
}

TEST_F(PersistenceCoordinatorTest, FlushWithStoppedExecutorKeepsEntitiesPending) {
    executor_->shutdown();
    coordinator_->scheduleWrite(EntityRef::node(nodeId_), 0);

    IoResult result = coordinator_->flush();

    EXPECT_EQ(result.code, IoErrorCode::Closed);
    EXPECT_TRUE(coordinator_->isPending(EntityRef::node(nodeId_)));
    EXPECT_EQ(coordinator_->inFlightCount(), 0u);
    EXPECT_EQ(errors_.size(), 1u);
}

TEST(PersistenceCoordinatorThreadTest, SerialExecutorWritesOffThread) {
    GraphStore graph;
    auto records = std::make_shared<FakeRecordStore>();
    ASSERT_TRUE(records->open());
    auto executor = std::make_shared<SerialTaskExecutor>();
    PersistenceCoordinator coordinator(graph, records, executor);

    Node node;
    node.id = graph.allocateNodeId();
    node.size = {400, 160};
    ASSERT_TRUE(graph.apply(MutationRecord::createNode(node)));
    coordinator.scheduleWrite(EntityRef::node(node.id), 0);

    ASSERT_TRUE(coordinator.flushAndWait());
    EXPECT_EQ(records->nodes().size(), 1u);
    executor->shutdown();
}
