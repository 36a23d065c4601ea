// tests/test_framework/fake_cluster.cpp
#include "fake_cluster.h"

#include <algorithm>
#include <chrono>
#include <numeric>

#include <fmt/format.h>

#include "kv/codec.hpp"

namespace rangekv::tests
{

using namespace rangekv::kv;

namespace
{

/// Decodes the request, runs @p fn on it, encodes the response.
template <typename Request, typename Fn>
nlohmann::json serve(const nlohmann::json &body, Fn &&fn)
{
    using Response = ResponseOf<Request>;
    auto req = decode_json<Request>(body);
    if (req.is_error())
    {
        return nlohmann::json(make_error_response<Response>(req.error()));
    }
    Response resp = fn(req.content());
    return nlohmann::json(resp);
}

int64_t now_nanos()
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // anonymous namespace

std::string FakeCluster::address_of(int32_t node_id)
{
    return fmt::format("fake://node-{}", node_id);
}

void FakeCluster::add_node(int32_t node_id, bool publish_address)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        nodes_by_address_[address_of(node_id)] = node_id;
    }
    if (publish_address)
    {
        gossip_.add_info(make_node_id_gossip_key(node_id), address_of(node_id));
    }
}

void FakeCluster::seed_single_range(const Replica &replica)
{
    RangeLocations locations;
    locations.start_key = KeyMin;
    locations.replicas = {replica};
    gossip_.add_info(std::string(kGossipFirstRangeKey), nlohmann::json(locations));
    put_locations(make_key(KeyMeta1Prefix, KeyMax), locations);
    put_locations(make_key(KeyMeta2Prefix, KeyMax), locations);
}

void FakeCluster::put_locations(const Key &meta_key, const RangeLocations &locations)
{
    put_raw(meta_key, Value{nlohmann::json(locations).dump(), now_nanos()});
}

void FakeCluster::fail_next_sends(int n, ErrorCode code)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pending_failures_ = n;
    failure_code_ = code;
}

void FakeCluster::set_range_lost(int32_t node_id, bool lost)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (lost)
        lost_range_nodes_.insert(node_id);
    else
        lost_range_nodes_.erase(node_id);
}

void FakeCluster::put_raw(const Key &key, const Value &value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    store_[key] = value;
}

std::optional<Value> FakeCluster::get_raw(const Key &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = store_.find(key);
    if (it == store_.end())
        return std::nullopt;
    return it->second;
}

int FakeCluster::calls(std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(method);
    return it == calls_.end() ? 0 : it->second;
}

int FakeCluster::total_calls() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::accumulate(calls_.begin(), calls_.end(), 0,
                           [](int acc, const auto &kv) { return acc + kv.second; });
}

std::vector<Key> FakeCluster::lookup_keys() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_keys_;
}

std::vector<std::string> FakeCluster::last_candidates() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_candidates_;
}

Replica FakeCluster::last_replica() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_replica_;
}

KvResult<nlohmann::json> FakeCluster::send(const std::vector<AddressedRequest> &requests,
                                           std::string_view method, const RpcOptions &)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_[std::string(method)];

    last_candidates_.clear();
    for (const auto &r : requests)
    {
        last_candidates_.push_back(r.address);
    }

    if (pending_failures_ > 0)
    {
        --pending_failures_;
        return KvResult<nlohmann::json>::error(
            KvError{failure_code_, fmt::format("{}: injected failure", method)});
    }

    for (const auto &r : requests)
    {
        auto node = nodes_by_address_.find(r.address);
        if (node == nodes_by_address_.end())
        {
            continue;
        }
        last_replica_ = r.body.at("header").at("replica").get<Replica>();
        return KvResult<nlohmann::json>::ok(handle(node->second, method, r.body));
    }
    return KvResult<nlohmann::json>::error(
        KvError{ErrorCode::Unreachable, fmt::format("{}: no candidate is a known node", method)});
}

nlohmann::json FakeCluster::range_lookup(const InternalRangeLookupRequest &req)
{
    lookup_keys_.push_back(req.key);

    InternalRangeLookupResponse resp;
    const Key &prefix =
        req.key.compare(0, KeyMeta1Prefix.size(), KeyMeta1Prefix) == 0 ? KeyMeta1Prefix : KeyMeta2Prefix;
    auto it = store_.upper_bound(req.key);
    if (it == store_.end() || it->first.compare(0, prefix.size(), prefix) != 0)
    {
        resp.header.error = KvError{ErrorCode::RangeNotFound,
                                    "no range metadata covers " + key_to_debug_string(req.key)};
        return nlohmann::json(resp);
    }
    auto locations = decode_json<RangeLocations>(nlohmann::json::parse(it->second.bytes));
    if (locations.is_error())
    {
        resp.header.error = locations.error();
        return nlohmann::json(resp);
    }
    resp.locations = std::move(locations).content();
    return nlohmann::json(resp);
}

nlohmann::json FakeCluster::handle(int32_t node_id, std::string_view method, const nlohmann::json &body)
{
    if (method == MethodTraits<InternalRangeLookupRequest>::name)
    {
        auto req = decode_json<InternalRangeLookupRequest>(body);
        if (req.is_error())
            return nlohmann::json(make_error_response<InternalRangeLookupResponse>(req.error()));
        return range_lookup(req.content());
    }

    const bool lost = lost_range_nodes_.count(node_id) > 0;
    const auto range_gone = [node_id](auto response)
    {
        response.header.error = KvError{ErrorCode::RangeNotFound,
                                        fmt::format("node {} no longer holds this range", node_id)};
        return response;
    };

    if (method == MethodTraits<ContainsRequest>::name)
    {
        return serve<ContainsRequest>(body,
                                      [&](const ContainsRequest &req)
                                      {
                                          if (lost)
                                              return range_gone(ContainsResponse{});
                                          ContainsResponse resp;
                                          resp.exists = store_.count(req.key) > 0;
                                          return resp;
                                      });
    }
    if (method == MethodTraits<GetRequest>::name)
    {
        return serve<GetRequest>(body,
                                 [&](const GetRequest &req)
                                 {
                                     if (lost)
                                         return range_gone(GetResponse{});
                                     GetResponse resp;
                                     auto it = store_.find(req.key);
                                     if (it != store_.end())
                                         resp.value = it->second;
                                     return resp;
                                 });
    }
    if (method == MethodTraits<PutRequest>::name)
    {
        return serve<PutRequest>(body,
                                 [&](const PutRequest &req)
                                 {
                                     if (lost)
                                         return range_gone(PutResponse{});
                                     store_[req.key] = req.value;
                                     PutResponse resp;
                                     resp.header.timestamp = req.value.timestamp;
                                     return resp;
                                 });
    }
    if (method == MethodTraits<IncrementRequest>::name)
    {
        return serve<IncrementRequest>(body,
                                       [&](const IncrementRequest &req)
                                       {
                                           if (lost)
                                               return range_gone(IncrementResponse{});
                                           IncrementResponse resp;
                                           int64_t current = 0;
                                           auto it = store_.find(req.key);
                                           if (it != store_.end() && !it->second.bytes.empty())
                                               current = nlohmann::json::parse(it->second.bytes).get<int64_t>();
                                           resp.new_value = current + req.increment;
                                           store_[req.key] = Value{nlohmann::json(resp.new_value).dump(), now_nanos()};
                                           return resp;
                                       });
    }
    if (method == MethodTraits<DeleteRequest>::name)
    {
        return serve<DeleteRequest>(body,
                                    [&](const DeleteRequest &req)
                                    {
                                        if (lost)
                                            return range_gone(DeleteResponse{});
                                        store_.erase(req.key);
                                        return DeleteResponse{};
                                    });
    }
    if (method == MethodTraits<DeleteRangeRequest>::name)
    {
        return serve<DeleteRangeRequest>(
            body,
            [&](const DeleteRangeRequest &req)
            {
                if (lost)
                    return range_gone(DeleteRangeResponse{});
                DeleteRangeResponse resp;
                auto it = store_.lower_bound(req.start_key);
                while (it != store_.end() && it->first < req.end_key &&
                       (req.max_entries_to_delete == 0 || resp.num_deleted < req.max_entries_to_delete))
                {
                    it = store_.erase(it);
                    ++resp.num_deleted;
                }
                return resp;
            });
    }
    if (method == MethodTraits<EndTransactionRequest>::name)
    {
        return serve<EndTransactionRequest>(body,
                                            [&](const EndTransactionRequest &req)
                                            {
                                                if (lost)
                                                    return range_gone(EndTransactionResponse{});
                                                EndTransactionResponse resp;
                                                if (req.commit)
                                                    resp.commit_timestamp = now_nanos();
                                                return resp;
                                            });
    }
    if (method == MethodTraits<AccumulateTSRequest>::name)
    {
        return serve<AccumulateTSRequest>(
            body,
            [&](const AccumulateTSRequest &req)
            {
                if (lost)
                    return range_gone(AccumulateTSResponse{});
                std::vector<int64_t> series(req.counts.size(), 0);
                auto it = store_.find(req.key);
                if (it != store_.end())
                    series = nlohmann::json::parse(it->second.bytes).get<std::vector<int64_t>>();
                series.resize(std::max(series.size(), req.counts.size()), 0);
                for (size_t i = 0; i < req.counts.size(); ++i)
                    series[i] += req.counts[i];
                store_[req.key] = Value{nlohmann::json(series).dump(), now_nanos()};
                return AccumulateTSResponse{};
            });
    }
    if (method == MethodTraits<ReapQueueRequest>::name)
    {
        return serve<ReapQueueRequest>(body,
                                       [&](const ReapQueueRequest &req)
                                       {
                                           if (lost)
                                               return range_gone(ReapQueueResponse{});
                                           ReapQueueResponse resp;
                                           auto &q = inboxes_[req.inbox];
                                           while (!q.empty() &&
                                                  (req.max_results == 0 ||
                                                   static_cast<int64_t>(resp.messages.size()) < req.max_results))
                                           {
                                               resp.messages.push_back(std::move(q.front()));
                                               q.pop_front();
                                           }
                                           return resp;
                                       });
    }
    if (method == MethodTraits<EnqueueMessageRequest>::name)
    {
        return serve<EnqueueMessageRequest>(body,
                                            [&](const EnqueueMessageRequest &req)
                                            {
                                                if (lost)
                                                    return range_gone(EnqueueMessageResponse{});
                                                inboxes_[req.inbox].push_back(req.message);
                                                return EnqueueMessageResponse{};
                                            });
    }

    ResponseHeader header;
    header.error = KvError{ErrorCode::NotImplemented, fmt::format("{} is not served", method)};
    return nlohmann::json{{"header", header}};
}

} // namespace rangekv::tests
