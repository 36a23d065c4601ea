#include "kv/node_resolver.hpp"

#include <fmt/format.h>

namespace rangekv::kv
{

KvResult<std::string> NodeAddressResolver::resolve(int32_t node_id) const
{
    const auto key = make_node_id_gossip_key(node_id);
    const auto info = gossip_.get_info(key);
    if (!info)
    {
        return KvResult<std::string>::error(KvError{
            ErrorCode::NodeAddressNotFound,
            fmt::format("unable to look up address for node {}: gossip key '{}' not found", node_id, key)});
    }
    if (!info->is_string() || info->get_ref<const std::string &>().empty())
    {
        return KvResult<std::string>::error(KvError{
            ErrorCode::NodeAddressNotFound,
            fmt::format("gossip info '{}' is not an address: {}", key, info->dump())});
    }
    return KvResult<std::string>::ok(info->get<std::string>());
}

} // namespace rangekv::kv
