/**
 * @file test_node_resolver.cpp
 * @brief NodeAddressResolver reads addresses from live gossip state.
 */
#include "kv/node_resolver.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace rangekv::kv;
using namespace rangekv::tests;

class NodeResolverTest : public PureApiTest
{
  protected:
    InMemoryGossip gossip;
    NodeAddressResolver resolver{gossip};
};

TEST_F(NodeResolverTest, GossipKeyFormat)
{
    EXPECT_EQ(make_node_id_gossip_key(7), "node:7");
}

TEST_F(NodeResolverTest, ResolvesGossipedAddress)
{
    gossip.add_info(make_node_id_gossip_key(7), "tcp://10.0.0.7:5570");
    auto addr = resolver.resolve(7);
    ASSERT_TRUE(addr.is_ok());
    EXPECT_EQ(addr.content(), "tcp://10.0.0.7:5570");
}

TEST_F(NodeResolverTest, MissingNodeIsNotFound)
{
    auto addr = resolver.resolve(8);
    ASSERT_TRUE(addr.is_error());
    EXPECT_EQ(addr.error().code(), ErrorCode::NodeAddressNotFound);
    EXPECT_NE(addr.error().message().find("node:8"), std::string::npos);
}

TEST_F(NodeResolverTest, NonStringInfoIsNotFound)
{
    gossip.add_info(make_node_id_gossip_key(9), nlohmann::json{{"host", "x"}});
    gossip.add_info(make_node_id_gossip_key(10), "");
    EXPECT_EQ(resolver.resolve(9).error().code(), ErrorCode::NodeAddressNotFound);
    EXPECT_EQ(resolver.resolve(10).error().code(), ErrorCode::NodeAddressNotFound);
}

/**
 * No caching: an address change or removal is seen on the next call.
 */
TEST_F(NodeResolverTest, FollowsGossipChanges)
{
    gossip.add_info(make_node_id_gossip_key(1), "inproc://a");
    EXPECT_EQ(resolver.resolve(1).content(), "inproc://a");

    gossip.add_info(make_node_id_gossip_key(1), "inproc://b");
    EXPECT_EQ(resolver.resolve(1).content(), "inproc://b");

    gossip.remove_info(make_node_id_gossip_key(1));
    EXPECT_TRUE(resolver.resolve(1).is_error());
}
