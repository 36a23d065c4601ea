// tests/test_framework/fake_cluster.h
#pragma once

/**
 * @file fake_cluster.h
 * @brief In-process stand-in for a cluster of storage nodes.
 *
 * FakeCluster is an RpcTransport. Every call is answered by the first
 * addressed candidate from one shared, sorted key-value map, the way a
 * healthy single-replica cluster would answer:
 *
 * - Node.InternalRangeLookup: first stored key greater than the lookup key
 *   within the same metadata level, decoded as RangeLocations; none gives a
 *   RangeNotFound reply.
 * - Point, range, transaction, time-series and queue methods operate on the map.
 *
 * Knobs for failure paths:
 * - fail_next_sends(n, code): the next n calls fail at the transport.
 * - set_range_lost(node, true): that node replies RangeNotFound to every
 *   data request (its cached range moved away).
 *
 * Thread-safe.
 */

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "kv/api.hpp"
#include "kv/error.hpp"
#include "kv/gossip.hpp"
#include "kv/transport.hpp"
#include "kv/types.hpp"

namespace rangekv::tests
{

class FakeCluster : public kv::RpcTransport
{
  public:
    /// Address gossiped by node @p node_id.
    static std::string address_of(int32_t node_id);

    explicit FakeCluster(kv::InMemoryGossip &gossip) : gossip_(gossip) {}

    /// Registers a node; it gossips its address unless @p publish_address is false.
    void add_node(int32_t node_id, bool publish_address = true);

    /**
     * @brief One range [KeyMin, +inf) on @p replica: gossips it as the first
     *        range and stores it at meta1+KeyMax and meta2+KeyMax.
     */
    void seed_single_range(const kv::Replica &replica);

    /// Writes @p locations at @p meta_key (a meta1/meta2-prefixed end key).
    void put_locations(const kv::Key &meta_key, const kv::RangeLocations &locations);

    // --- Failure injection ---
    void fail_next_sends(int n, kv::ErrorCode code);
    void set_range_lost(int32_t node_id, bool lost);

    // --- Direct store access ---
    void put_raw(const kv::Key &key, const kv::Value &value);
    [[nodiscard]] std::optional<kv::Value> get_raw(const kv::Key &key) const;

    // --- Observations ---
    [[nodiscard]] int calls(std::string_view method) const;
    [[nodiscard]] int total_calls() const;
    /// Keys of every Node.InternalRangeLookup served, in order.
    [[nodiscard]] std::vector<kv::Key> lookup_keys() const;
    /// Candidate addresses of the most recent call, in the order given.
    [[nodiscard]] std::vector<std::string> last_candidates() const;
    /// Replica stamped on the request the most recent call answered.
    [[nodiscard]] kv::Replica last_replica() const;

    [[nodiscard]] kv::KvResult<nlohmann::json> send(const std::vector<kv::AddressedRequest> &requests,
                                                    std::string_view method,
                                                    const kv::RpcOptions &options) override;

  private:
    // All handlers run with mutex_ held.
    nlohmann::json handle(int32_t node_id, std::string_view method, const nlohmann::json &body);
    nlohmann::json range_lookup(const kv::InternalRangeLookupRequest &req);

    kv::InMemoryGossip &gossip_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, int32_t> nodes_by_address_;
    std::set<int32_t> lost_range_nodes_;
    std::map<kv::Key, kv::Value> store_;
    std::map<kv::Key, std::deque<kv::Value>> inboxes_;

    int pending_failures_{0};
    kv::ErrorCode failure_code_{kv::ErrorCode::Timeout};

    std::map<std::string, int, std::less<>> calls_;
    std::vector<kv::Key> lookup_keys_;
    std::vector<std::string> last_candidates_;
    kv::Replica last_replica_;
};

} // namespace rangekv::tests
