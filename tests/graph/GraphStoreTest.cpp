#include <gtest/gtest.h>
#include <canvascore/graph/GraphStore.h>

using namespace canvascore;

namespace {

Node makeNode(NodeId id, Point pos = {0, 0}, std::optional<std::string> color = std::nullopt) {
    Node node;
    node.id = id;
    node.position = pos;
    node.size = {400, 160};
    node.content = {"note", "payload-" + std::to_string(id)};
    node.color = std::move(color);
    node.createdAt = 1000 + static_cast<Timestamp>(id);
    node.updatedAt = node.createdAt;
    return node;
}

Edge makeEdge(EdgeId id, NodeId source, NodeId target,
              std::optional<std::string> color = std::nullopt) {
    Edge edge;
    edge.id = id;
    edge.source = source;
    edge.target = target;
    edge.color = std::move(color);
    edge.createdAt = 5000 + static_cast<Timestamp>(id);
    return edge;
}

}  // namespace

class GraphStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store_.apply(MutationRecord::createNode(makeNode(1, {0, 0}, "blue"))));
        ASSERT_TRUE(store_.apply(MutationRecord::createNode(makeNode(2, {100, 100}))));
        ASSERT_TRUE(store_.apply(MutationRecord::createNode(makeNode(3, {300, 0}))));
    }

    GraphStore store_;
};

TEST_F(GraphStoreTest, CreateNodeBumpsVersionOnce) {
    uint64_t before = store_.version();
    ApplyResult result = store_.apply(MutationRecord::createNode(makeNode(10)));

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(store_.version(), before + 1);
    EXPECT_EQ(result.version, store_.version());
    EXPECT_TRUE(store_.hasNode(10));
}

TEST_F(GraphStoreTest, DuplicateNodeIdRejected) {
    uint64_t before = store_.version();
    ApplyResult result = store_.apply(MutationRecord::createNode(makeNode(1)));

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, GraphError::DuplicateId);
    EXPECT_EQ(store_.version(), before);
}

TEST_F(GraphStoreTest, NodeSizeOutsideLimitsRejected) {
    Node tiny = makeNode(10);
    tiny.size = {10, 10};

    ApplyResult result = store_.apply(MutationRecord::createNode(tiny));
    EXPECT_EQ(result.error, GraphError::InvalidSize);
    EXPECT_FALSE(store_.hasNode(10));
}

TEST_F(GraphStoreTest, NodeCapacityEnforced) {
    GraphLimits limits;
    limits.maxNodes = 3;
    store_.setLimits(limits);

    ApplyResult result = store_.apply(MutationRecord::createNode(makeNode(10)));
    EXPECT_EQ(result.error, GraphError::CapacityExceeded);
}

TEST_F(GraphStoreTest, EdgeRequiresBothEndpoints) {
    ApplyResult result = store_.apply(MutationRecord::createEdge(makeEdge(1, 1, 99)));

    EXPECT_EQ(result.error, GraphError::MissingEndpoint);
    EXPECT_EQ(store_.edgeCount(), 0u);
}

TEST_F(GraphStoreTest, SelfLoopRejected) {
    ApplyResult result = store_.apply(MutationRecord::createEdge(makeEdge(1, 2, 2)));
    EXPECT_EQ(result.error, GraphError::SelfLoop);
}

TEST_F(GraphStoreTest, DeleteNodeCascadesEdgesInOneVersion) {
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(1, 1, 2))));
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(2, 3, 1))));
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(3, 2, 3))));

    uint64_t before = store_.version();
    auto incident = store_.incidentEdges(1);
    ASSERT_EQ(incident.size(), 2u);

    ApplyResult result = store_.apply(MutationRecord::deleteNode(*store_.findNode(1), incident));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(store_.version(), before + 1);
    EXPECT_FALSE(store_.hasNode(1));
    EXPECT_FALSE(store_.hasEdge(1));
    EXPECT_FALSE(store_.hasEdge(2));
    EXPECT_TRUE(store_.hasEdge(3));
}

TEST_F(GraphStoreTest, DeleteNodeWithIncompleteCascadeRejected) {
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(1, 1, 2))));
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(2, 3, 1))));

    // Only one of the two incident edges listed
    std::vector<Edge> partial = {*store_.findEdge(1)};
    uint64_t before = store_.version();
    ApplyResult result = store_.apply(MutationRecord::deleteNode(*store_.findNode(1), partial));

    EXPECT_EQ(result.error, GraphError::CascadeMismatch);
    EXPECT_EQ(store_.version(), before);
    EXPECT_TRUE(store_.hasNode(1));
    EXPECT_EQ(store_.edgeCount(), 2u);
}

TEST_F(GraphStoreTest, InverseOfDeleteRestoresNodeAndEdges) {
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(1, 1, 2, "red"))));
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(2, 3, 1))));
    auto original = store_.snapshot();

    MutationRecord del = MutationRecord::deleteNode(*store_.findNode(1), store_.incidentEdges(1));
    ASSERT_TRUE(store_.apply(del));
    ASSERT_TRUE(store_.apply(del.inverse()));

    EXPECT_TRUE(store_.snapshot()->sameContent(*original));
}

TEST_F(GraphStoreTest, StaleUpdateRejected) {
    Node before = *store_.findNode(2);
    Node after = before;
    after.color = "green";
    after.updatedAt += 10;
    ASSERT_TRUE(store_.apply(MutationRecord::updateNode(before, after)));

    // Same record again: "before" no longer matches
    ApplyResult result = store_.apply(MutationRecord::updateNode(before, after));
    EXPECT_EQ(result.error, GraphError::StaleRecord);
}

TEST_F(GraphStoreTest, MoveChecksStartPosition) {
    const Node* node = store_.findNode(3);
    ApplyResult wrongStart = store_.apply(
        MutationRecord::moveNode(3, {1, 1}, {50, 50}, node->updatedAt, node->updatedAt + 1));
    EXPECT_EQ(wrongStart.error, GraphError::StaleRecord);

    ApplyResult ok = store_.apply(
        MutationRecord::moveNode(3, node->position, {50, 50}, node->updatedAt, node->updatedAt + 1));
    EXPECT_TRUE(ok.ok);
    EXPECT_EQ(store_.findNode(3)->position, Point(50, 50));
}

TEST_F(GraphStoreTest, EdgeEndpointsAreImmutable) {
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(1, 1, 2))));
    Edge before = *store_.findEdge(1);
    Edge after = before;
    after.target = 3;

    ApplyResult result = store_.apply(MutationRecord::updateEdge(before, after));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(store_.findEdge(1)->target, 2u);
}

TEST_F(GraphStoreTest, SnapshotIsSharedUntilNextChange) {
    auto first = store_.snapshot();
    auto second = store_.snapshot();
    EXPECT_EQ(first.get(), second.get());

    ASSERT_TRUE(store_.apply(MutationRecord::createNode(makeNode(10))));
    auto third = store_.snapshot();

    EXPECT_NE(first.get(), third.get());
    EXPECT_EQ(first->nodes.size(), 3u);
    EXPECT_EQ(third->nodes.size(), 4u);
    EXPECT_EQ(third->version, store_.version());
}

TEST_F(GraphStoreTest, EdgeColorFallsBackToSourceNode) {
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(1, 1, 2))));
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(2, 2, 1))));
    ASSERT_TRUE(store_.apply(MutationRecord::createEdge(makeEdge(3, 3, 1, "purple"))));

    EXPECT_EQ(store_.effectiveEdgeColor(*store_.findEdge(1)), "blue");
    EXPECT_FALSE(store_.effectiveEdgeColor(*store_.findEdge(2)).has_value());
    EXPECT_EQ(store_.effectiveEdgeColor(*store_.findEdge(3)), "purple");
    // Stored value is untouched
    EXPECT_FALSE(store_.findEdge(1)->color.has_value());
}

TEST(GraphStoreLoadTest, PrunesDanglingEdgesAndKeepsTimestamps) {
    GraphStore store;
    std::vector<Node> nodes = {makeNode(4), makeNode(7)};
    std::vector<Edge> edges = {makeEdge(1, 4, 7), makeEdge(2, 4, 99), makeEdge(3, 7, 7)};

    LoadReport report = store.load(nodes, edges);

    EXPECT_EQ(report.nodesLoaded, 2u);
    EXPECT_EQ(report.edgesLoaded, 1u);
    ASSERT_EQ(report.prunedEdges.size(), 2u);
    EXPECT_EQ(report.prunedEdges[0], 2u);
    EXPECT_EQ(report.prunedEdges[1], 3u);
    EXPECT_EQ(store.findNode(4)->createdAt, nodes[0].createdAt);
    EXPECT_EQ(store.findEdge(1)->createdAt, edges[0].createdAt);
    EXPECT_EQ(store.version(), 1u);
}

TEST(GraphStoreLoadTest, IdAllocationContinuesAfterLoadedIds) {
    GraphStore store;
    store.load({makeNode(41)}, {});

    EXPECT_EQ(store.allocateNodeId(), 42u);
    EXPECT_EQ(store.allocateEdgeId(), 1u);
}
