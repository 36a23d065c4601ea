#pragma once
/**
 * @file transport.hpp
 * @brief Contract between the replica sender and the RPC layer.
 *
 * The transport receives one encoded request per candidate replica (already
 * addressed and stamped with that replica) and must return the first reply
 * any candidate produces:
 *
 * 1. Send to the first candidate.
 * 2. Whenever `send_next_timeout` passes without a reply, also send to the
 *    next unused candidate.
 * 3. Return the first reply received; outstanding requests are abandoned.
 * 4. Fail with ErrorCode::Timeout once `timeout` passes with no reply.
 *
 * Connection failures must be reported as ErrorCode::Unreachable, so the
 * router sees them as retryable.
 */

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "kv/error.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

struct RpcOptions
{
    std::chrono::milliseconds send_next_timeout{1000};
    std::chrono::milliseconds timeout{15000};
};

struct AddressedRequest
{
    std::string address;
    nlohmann::json body;
};

class RANGEKV_CORE_EXPORT RpcTransport
{
  public:
    virtual ~RpcTransport() = default;

    /**
     * @brief Sends @p method to the candidates in order; returns the first reply body.
     * @pre @p requests is not empty.
     */
    [[nodiscard]] virtual KvResult<nlohmann::json> send(const std::vector<AddressedRequest> &requests,
                                                        std::string_view method,
                                                        const RpcOptions &options) = 0;
};

} // namespace rangekv::kv
