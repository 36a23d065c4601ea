#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy for routing and dispatch.
 *
 * Every failure the router can observe maps to an ErrorCode. The code alone
 * decides whether the router backs off and retries:
 *
 * | Code                 | Retryable | Raised by                                  |
 * |----------------------|-----------|--------------------------------------------|
 * | FirstRangeMissing    | yes       | range resolver (gossip not converged)      |
 * | NoNodeAddrsAvailable | yes       | replica sender (no gossiped address)       |
 * | Timeout              | yes       | transport                                  |
 * | Unreachable          | yes       | transport                                  |
 * | RangeNotFound        | yes       | storage node (stale cached location)       |
 * | NodeAddressNotFound  | no        | node resolver (skipped by the sender)      |
 * | EmptyReplicaSet      | no        | replica sender (corrupt metadata)          |
 * | InvalidArgument      | no        | facade                                     |
 * | Codec                | no        | wire decoding                              |
 * | NotImplemented       | no        | facade (scan, enqueue-update)              |
 * | Shutdown             | no        | router destroyed while retrying            |
 * | Internal             | no        | anything else                              |
 */

#include <string>
#include <utility>

#include "utils/result.hpp"

namespace rangekv::kv
{

enum class ErrorCode
{
    Internal = 0,
    FirstRangeMissing,
    NoNodeAddrsAvailable,
    Timeout,
    Unreachable,
    RangeNotFound,
    NodeAddressNotFound,
    EmptyReplicaSet,
    InvalidArgument,
    Codec,
    NotImplemented,
    Shutdown,
};

inline const char *to_string(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::Internal:
        return "Internal";
    case ErrorCode::FirstRangeMissing:
        return "FirstRangeMissing";
    case ErrorCode::NoNodeAddrsAvailable:
        return "NoNodeAddrsAvailable";
    case ErrorCode::Timeout:
        return "Timeout";
    case ErrorCode::Unreachable:
        return "Unreachable";
    case ErrorCode::RangeNotFound:
        return "RangeNotFound";
    case ErrorCode::NodeAddressNotFound:
        return "NodeAddressNotFound";
    case ErrorCode::EmptyReplicaSet:
        return "EmptyReplicaSet";
    case ErrorCode::InvalidArgument:
        return "InvalidArgument";
    case ErrorCode::Codec:
        return "Codec";
    case ErrorCode::NotImplemented:
        return "NotImplemented";
    case ErrorCode::Shutdown:
        return "Shutdown";
    default:
        return "Unknown";
    }
}

/**
 * @brief Whether the router may retry an operation that failed with @p code.
 */
constexpr bool is_retryable(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::FirstRangeMissing:
    case ErrorCode::NoNodeAddrsAvailable:
    case ErrorCode::Timeout:
    case ErrorCode::Unreachable:
    case ErrorCode::RangeNotFound:
        return true;
    default:
        return false;
    }
}

/**
 * @class KvError
 * @brief A classified failure with a human-readable message.
 */
class KvError
{
  public:
    KvError() = default;
    KvError(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string &message() const noexcept { return message_; }
    [[nodiscard]] bool retryable() const noexcept { return is_retryable(code_); }

    /// "<Code>: <message>"
    [[nodiscard]] std::string to_string() const
    {
        return std::string(kv::to_string(code_)) + ": " + message_;
    }

    bool operator==(const KvError &other) const = default;

  private:
    ErrorCode code_{ErrorCode::Internal};
    std::string message_;
};

template <typename T>
using KvResult = utils::Result<T, KvError>;

} // namespace rangekv::kv
