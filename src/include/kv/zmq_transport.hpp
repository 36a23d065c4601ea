#pragma once
/**
 * @file zmq_transport.hpp
 * @brief RpcTransport over ZeroMQ DEALER sockets.
 *
 * One DEALER socket per contacted candidate, connected to its gossiped
 * endpoint ("tcp://host:port", "inproc://name", ...). Wire layout, both
 * directions:
 *
 *   Frame 0: 'C'            (control frame marker)
 *   Frame 1: method name    ("Node.Get", ...)
 *   Frame 2: JSON body      (request or response, see codec.hpp)
 *
 * A storage node serves requests on a ROUTER socket and echoes the layout
 * back behind the peer identity frame.
 *
 * Errors:
 * - no reply before `timeout`                 → ErrorCode::Timeout
 * - every candidate failed to connect/send    → ErrorCode::Unreachable
 * - reply with wrong framing or invalid JSON  → ErrorCode::Codec, once no
 *   other candidate is left to answer
 *
 * A candidate that sends a malformed reply is dropped and the next candidate
 * is contacted at once.
 *
 * Sockets live for one send() call only and are closed with linger 0, so
 * late replies to abandoned requests are dropped.
 */

#include <zmq.hpp>

#include "kv/transport.hpp"
#include "rangekv_core_export.h"

namespace rangekv::kv
{

class RANGEKV_CORE_EXPORT ZmqTransport : public RpcTransport
{
  public:
    /// @param context Must outlive the transport.
    explicit ZmqTransport(zmq::context_t &context) : context_(context) {}

    [[nodiscard]] KvResult<nlohmann::json> send(const std::vector<AddressedRequest> &requests,
                                                std::string_view method,
                                                const RpcOptions &options) override;

  private:
    zmq::context_t &context_;
};

} // namespace rangekv::kv
