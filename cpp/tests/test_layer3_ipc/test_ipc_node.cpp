/**
 * @file test_ipc_node.cpp
 * @brief Node registration, listing, liveness and dead-node cleanup.
 */
#include "solo_ipc.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "workers/ipc_test_types.h"
#include <gtest/gtest.h>
#include <chrono>
#include <vector>

using namespace solohub::hub;
using namespace solohub::tests;
using namespace solohub::tests::helper;
using namespace std::chrono_literals;

namespace
{

NodeName node_name(const char *name)
{
    return NodeName::create(name).content();
}

std::vector<NodeState> list_nodes(const TransportConfig &config)
{
    std::vector<NodeState> nodes;
    auto listed = Node::list(config, [&nodes](const NodeState &s) { nodes.push_back(s); });
    EXPECT_TRUE(listed.is_ok());
    return nodes;
}

const NodeState *find_node(const std::vector<NodeState> &nodes, uint64_t node_id)
{
    for (const auto &n : nodes)
        if (n.details().node_id == node_id)
            return &n;
    return nullptr;
}

/// Parses "KEY=<n>" out of a worker's stdout; 0 if absent.
uint64_t parse_stdout_value(const std::string &out, const std::string &key)
{
    const auto pos = out.find(key + "=");
    if (pos == std::string::npos)
        return 0;
    return std::stoull(out.substr(pos + key.size() + 1));
}

} // namespace

class IpcNodeTest : public ::testing::Test
{
};

TEST_F(IpcNodeTest, CreateRegistersNodeInDomain)
{
    DomainTestGuard guard("NodeCreate");
    const TransportConfig config = test_transport(guard.domain());

    auto node = Node::create(node_name("viewer"), config);
    ASSERT_TRUE(node.is_ok()) << to_string(node.error());
    EXPECT_EQ(node.content().name().as_string(), "viewer");
    EXPECT_EQ(node.content().config().domain, guard.domain());

    const auto nodes = list_nodes(config);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0].details().node_id, node.content().id());
    EXPECT_EQ(nodes[0].details().name, "viewer");
    EXPECT_EQ(nodes[0].details().owner_pid, solohub::platform::get_pid());
    EXPECT_EQ(nodes[0].liveness(), NodeLiveness::Alive);
}

TEST_F(IpcNodeTest, NodeIdsAreDistinct)
{
    DomainTestGuard guard("NodeIds");
    const TransportConfig config = test_transport(guard.domain());

    auto a = Node::create(node_name("a"), config);
    auto b = Node::create(node_name("a"), config);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.content().id(), b.content().id()) << "Same name, still two nodes";
    EXPECT_EQ(list_nodes(config).size(), 2u);
}

TEST_F(IpcNodeTest, DroppingNodeRemovesItsEntry)
{
    DomainTestGuard guard("NodeDrop");
    const TransportConfig config = test_transport(guard.domain());

    auto keep = Node::create(node_name("keep"), config);
    ASSERT_TRUE(keep.is_ok());
    uint64_t dropped_id = 0;
    {
        auto temp = Node::create(node_name("temp"), config);
        ASSERT_TRUE(temp.is_ok());
        dropped_id = temp.content().id();
        EXPECT_EQ(list_nodes(config).size(), 2u);
    }
    const auto nodes = list_nodes(config);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(find_node(nodes, dropped_id), nullptr);
}

TEST_F(IpcNodeTest, ListOfUnknownDomainIsEmpty)
{
    DomainTestGuard guard("NodeListEmpty");
    int calls = 0;
    auto listed = Node::list(test_transport(guard.domain()), [&calls](const NodeState &) { ++calls; });
    ASSERT_TRUE(listed.is_ok());
    EXPECT_EQ(calls, 0);
}

TEST_F(IpcNodeTest, LastNodeLeavingRetiresRegistry)
{
    DomainTestGuard guard("NodeRetire");
    const TransportConfig config = test_transport(guard.domain());
    {
        auto node = Node::create(node_name("only"), config);
        ASSERT_TRUE(node.is_ok());
    }
    EXPECT_TRUE(list_nodes(config).empty());

    // A later node starts a fresh registry.
    auto again = Node::create(node_name("again"), config);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(list_nodes(config).size(), 1u);
}

TEST_F(IpcNodeTest, InvalidDomainIsRejected)
{
    TransportConfig config;
    config.domain = "bad/domain";
    auto node = Node::create(node_name("n"), config);
    ASSERT_TRUE(node.is_error());
    EXPECT_EQ(node.error(), NodeCreationFailure::InvalidConfiguration);
}

TEST_F(IpcNodeTest, OutOfRangeLimitsAreRejected)
{
    DomainTestGuard guard("NodeLimits");
    TransportConfig config = test_transport(guard.domain());
    config.subscriber_buffer_size = 0;
    auto node = Node::create(node_name("n"), config);
    ASSERT_TRUE(node.is_error());
    EXPECT_EQ(node.error(), NodeCreationFailure::InvalidConfiguration);

    config = test_transport(guard.domain());
    config.max_listeners = 1000;
    EXPECT_EQ(Node::create(node_name("n"), config).error(), NodeCreationFailure::InvalidConfiguration);
}

TEST_F(IpcNodeTest, WaitSleepsForDuration)
{
    DomainTestGuard guard("NodeWait");
    auto node = Node::create(node_name("sleeper"), test_transport(guard.domain()));
    ASSERT_TRUE(node.is_ok());

    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(node.content().wait(20ms).is_ok());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);

    EXPECT_TRUE(node.content().wait(0ns).is_ok());
    EXPECT_TRUE(node.content().wait(-5ms).is_ok());
}

TEST_F(IpcNodeTest, StaleCleanupRefusesLiveNode)
{
    DomainTestGuard guard("NodeLive");
    const TransportConfig config = test_transport(guard.domain());
    auto node = Node::create(node_name("alive"), config);
    ASSERT_TRUE(node.is_ok());

    const auto nodes = list_nodes(config);
    ASSERT_EQ(nodes.size(), 1u);
    auto cleaned = nodes[0].remove_stale_resources();
    ASSERT_TRUE(cleaned.is_error());
    EXPECT_EQ(cleaned.error(), NodeCleanupFailure::NodeStillAlive);
    EXPECT_EQ(list_nodes(config).size(), 1u);
}

// ============================================================================
// Processes that die without dropping their nodes
// ============================================================================

class IpcNodeProcessTest : public IsolatedProcessTest
{
};

TEST_F(IpcNodeProcessTest, DeadNodeIsListedAndRemoved)
{
    DomainTestGuard guard("NodeDead");
    const TransportConfig config = test_transport(guard.domain());

    auto proc = SpawnWorker("node.exit_without_cleanup", {guard.domain(), "crasher"});
    ExpectWorkerOk(*proc);
    const uint64_t dead_id = parse_stdout_value(proc->get_stdout(), "NODE_ID");
    ASSERT_NE(dead_id, 0u) << "stdout:\n" << proc->get_stdout();

    auto nodes = list_nodes(config);
    const NodeState *dead = find_node(nodes, dead_id);
    ASSERT_NE(dead, nullptr);
    EXPECT_EQ(dead->liveness(), NodeLiveness::Dead);
    EXPECT_EQ(dead->details().owner_pid, proc->pid());
    EXPECT_EQ(dead->details().name, "crasher");

    ASSERT_TRUE(dead->remove_stale_resources().is_ok());
    EXPECT_EQ(find_node(list_nodes(config), dead_id), nullptr);

    // Removing it again is not an error.
    EXPECT_TRUE(dead->remove_stale_resources().is_ok());
}

TEST_F(IpcNodeProcessTest, NodeCreationSweepsDeadNodes)
{
    DomainTestGuard guard("NodeSweep");
    const TransportConfig config = test_transport(guard.domain());

    auto proc = SpawnWorker("node.exit_without_cleanup", {guard.domain(), "crasher"});
    ExpectWorkerOk(*proc);
    const uint64_t dead_id = parse_stdout_value(proc->get_stdout(), "NODE_ID");
    ASSERT_NE(find_node(list_nodes(config), dead_id), nullptr);

    TransportConfig no_sweep = config;
    no_sweep.cleanup_dead_nodes_on_creation = false;
    auto quiet = Node::create(node_name("quiet"), no_sweep);
    ASSERT_TRUE(quiet.is_ok());
    EXPECT_NE(find_node(list_nodes(config), dead_id), nullptr) << "Sweep was disabled";

    auto sweeper = Node::create(node_name("sweeper"), config);
    ASSERT_TRUE(sweeper.is_ok());
    const auto nodes = list_nodes(config);
    EXPECT_EQ(find_node(nodes, dead_id), nullptr);
    EXPECT_EQ(nodes.size(), 2u);
}

TEST_F(IpcNodeProcessTest, SweepFreesSubscriberSlotOfDeadProcess)
{
    DomainTestGuard guard("NodeSweepSlot", {"slot"});
    TransportConfig config = test_transport(guard.domain());
    config.cleanup_dead_nodes_on_creation = false;
    const ServiceName service = ServiceName::create("slot").content();

    auto node = Node::create(node_name("survivor"), config);
    ASSERT_TRUE(node.is_ok());
    auto svc = PubSubService<TestMessage>::open_or_create(node.content(), service);
    ASSERT_TRUE(svc.is_ok()) << to_string(svc.error());

    auto proc = SpawnWorker("node.hold_subscriber_and_die", {guard.domain(), "slot"});
    ExpectWorkerOk(*proc);

    auto taken = svc.content().subscriber();
    ASSERT_TRUE(taken.is_error()) << "Dead process still holds the slot";
    EXPECT_EQ(taken.error(), SubscriberCreateError::ExceedsMaxSupportedSubscribers);

    TransportConfig sweeping = config;
    sweeping.cleanup_dead_nodes_on_creation = true;
    auto sweeper = Node::create(node_name("sweeper"), sweeping);
    ASSERT_TRUE(sweeper.is_ok());

    auto sub = svc.content().subscriber();
    EXPECT_TRUE(sub.is_ok()) << "Sweep should have released the dead subscriber";
}
