/**
 * @file codec.cpp
 * @brief JSON encoding of the data model and RPC messages.
 */
#include "kv/codec.hpp"

#include <array>
#include <stdexcept>

namespace rangekv::kv
{

using nlohmann::json;

namespace
{
constexpr unsigned int kNibbleMask = 0x0FU;
constexpr int kHexLetterOffset = 10;

int hex_val(char hex_char) noexcept
{
    if (hex_char >= '0' && hex_char <= '9') return hex_char - '0';
    if (hex_char >= 'a' && hex_char <= 'f') return hex_char - 'a' + kHexLetterOffset;
    if (hex_char >= 'A' && hex_char <= 'F') return hex_char - 'A' + kHexLetterOffset;
    return -1;
}

json bytes_to_json(std::string_view raw)
{
    return hex_encode(raw);
}

std::string bytes_from_json(const json &j, const char *field)
{
    auto decoded = hex_decode(j.at(field).get_ref<const std::string &>());
    if (!decoded)
    {
        throw std::invalid_argument(std::string("field '") + field + "' is not valid hex");
    }
    return std::move(*decoded);
}

ErrorCode error_code_from_string(const std::string &name)
{
    static constexpr std::array kAll = {
        ErrorCode::Internal,        ErrorCode::FirstRangeMissing, ErrorCode::NoNodeAddrsAvailable,
        ErrorCode::Timeout,         ErrorCode::Unreachable,       ErrorCode::RangeNotFound,
        ErrorCode::NodeAddressNotFound, ErrorCode::EmptyReplicaSet, ErrorCode::InvalidArgument,
        ErrorCode::Codec,           ErrorCode::NotImplemented,    ErrorCode::Shutdown,
    };
    for (ErrorCode code : kAll)
    {
        if (name == to_string(code))
            return code;
    }
    // Codes from a newer node degrade to a fatal error rather than failing the decode.
    return ErrorCode::Internal;
}
} // namespace

std::string hex_encode(std::string_view raw)
{
    static const std::array<char, 17> kHexChars = {"0123456789abcdef"};
    std::string out;
    out.reserve(raw.size() * 2);
    for (unsigned char byte : raw)
    {
        out += kHexChars[(byte >> 4) & kNibbleMask];
        out += kHexChars[byte & kNibbleMask];
    }
    return out;
}

std::optional<std::string> hex_decode(std::string_view hex)
{
    if (hex.size() % 2 != 0)
        return std::nullopt;
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        const int high_val = hex_val(hex[i]);
        const int low_val = hex_val(hex[i + 1]);
        if (high_val < 0 || low_val < 0)
            return std::nullopt;
        out += static_cast<char>((high_val << 4) | low_val);
    }
    return out;
}

// ============================================================================
// Data model
// ============================================================================

void to_json(json &j, const Replica &v)
{
    j = json{{"node_id", v.node_id}};
    if (v.store_id)
        j["store_id"] = *v.store_id;
}

void from_json(const json &j, Replica &v)
{
    v.node_id = j.at("node_id").get<int32_t>();
    v.store_id.reset();
    if (j.contains("store_id") && !j["store_id"].is_null())
        v.store_id = j["store_id"].get<int32_t>();
}

void to_json(json &j, const RangeLocations &v)
{
    j = json{{"start_key", bytes_to_json(v.start_key)}, {"replicas", v.replicas}};
    if (v.end_key)
        j["end_key"] = bytes_to_json(*v.end_key);
}

void from_json(const json &j, RangeLocations &v)
{
    v.start_key = bytes_from_json(j, "start_key");
    v.end_key.reset();
    if (j.contains("end_key") && !j["end_key"].is_null())
        v.end_key = bytes_from_json(j, "end_key");
    v.replicas = j.at("replicas").get<std::vector<Replica>>();
}

void to_json(json &j, const Value &v)
{
    j = json{{"bytes", bytes_to_json(v.bytes)}, {"timestamp", v.timestamp}};
}

void from_json(const json &j, Value &v)
{
    v.bytes = bytes_from_json(j, "bytes");
    v.timestamp = j.value("timestamp", int64_t{0});
}

void to_json(json &j, const KeyValue &v)
{
    j = json{{"key", bytes_to_json(v.key)}, {"value", v.value}};
}

void from_json(const json &j, KeyValue &v)
{
    v.key = bytes_from_json(j, "key");
    v.value = j.at("value").get<Value>();
}

void to_json(json &j, const KvError &v)
{
    j = json{{"code", to_string(v.code())}, {"message", v.message()}};
}

void from_json(const json &j, KvError &v)
{
    v = KvError{error_code_from_string(j.at("code").get<std::string>()),
                j.value("message", std::string{})};
}

void to_json(json &j, const RequestHeader &v)
{
    j = json{{"replica", v.replica}, {"timestamp", v.timestamp}};
    if (v.txn_id)
        j["txn_id"] = *v.txn_id;
}

void from_json(const json &j, RequestHeader &v)
{
    v.replica = j.at("replica").get<Replica>();
    v.timestamp = j.value("timestamp", int64_t{0});
    v.txn_id.reset();
    if (j.contains("txn_id") && !j["txn_id"].is_null())
        v.txn_id = j["txn_id"].get<std::string>();
}

void to_json(json &j, const ResponseHeader &v)
{
    j = json{{"timestamp", v.timestamp}};
    if (v.error)
        j["error"] = *v.error;
}

void from_json(const json &j, ResponseHeader &v)
{
    v.timestamp = j.value("timestamp", int64_t{0});
    v.error.reset();
    if (j.contains("error") && !j["error"].is_null())
        v.error = j["error"].get<KvError>();
}

// ============================================================================
// RPC messages
// ============================================================================

void to_json(json &j, const ContainsRequest &v)
{
    j = json{{"header", v.header}, {"key", bytes_to_json(v.key)}};
}
void from_json(const json &j, ContainsRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.key = bytes_from_json(j, "key");
}
void to_json(json &j, const ContainsResponse &v)
{
    j = json{{"header", v.header}, {"exists", v.exists}};
}
void from_json(const json &j, ContainsResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
    v.exists = j.value("exists", false);
}

void to_json(json &j, const GetRequest &v)
{
    j = json{{"header", v.header}, {"key", bytes_to_json(v.key)}};
}
void from_json(const json &j, GetRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.key = bytes_from_json(j, "key");
}
void to_json(json &j, const GetResponse &v)
{
    j = json{{"header", v.header}, {"value", v.value}};
}
void from_json(const json &j, GetResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
    v.value = j.contains("value") ? j["value"].get<Value>() : Value{};
}

void to_json(json &j, const PutRequest &v)
{
    j = json{{"header", v.header}, {"key", bytes_to_json(v.key)}, {"value", v.value}};
}
void from_json(const json &j, PutRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.key = bytes_from_json(j, "key");
    v.value = j.at("value").get<Value>();
}
void to_json(json &j, const PutResponse &v)
{
    j = json{{"header", v.header}};
}
void from_json(const json &j, PutResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
}

void to_json(json &j, const IncrementRequest &v)
{
    j = json{{"header", v.header}, {"key", bytes_to_json(v.key)}, {"increment", v.increment}};
}
void from_json(const json &j, IncrementRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.key = bytes_from_json(j, "key");
    v.increment = j.at("increment").get<int64_t>();
}
void to_json(json &j, const IncrementResponse &v)
{
    j = json{{"header", v.header}, {"new_value", v.new_value}};
}
void from_json(const json &j, IncrementResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
    v.new_value = j.value("new_value", int64_t{0});
}

void to_json(json &j, const DeleteRequest &v)
{
    j = json{{"header", v.header}, {"key", bytes_to_json(v.key)}};
}
void from_json(const json &j, DeleteRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.key = bytes_from_json(j, "key");
}
void to_json(json &j, const DeleteResponse &v)
{
    j = json{{"header", v.header}};
}
void from_json(const json &j, DeleteResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
}

void to_json(json &j, const DeleteRangeRequest &v)
{
    j = json{{"header", v.header},
             {"start_key", bytes_to_json(v.start_key)},
             {"end_key", bytes_to_json(v.end_key)},
             {"max_entries_to_delete", v.max_entries_to_delete}};
}
void from_json(const json &j, DeleteRangeRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.start_key = bytes_from_json(j, "start_key");
    v.end_key = bytes_from_json(j, "end_key");
    v.max_entries_to_delete = j.value("max_entries_to_delete", int64_t{0});
}
void to_json(json &j, const DeleteRangeResponse &v)
{
    j = json{{"header", v.header}, {"num_deleted", v.num_deleted}};
}
void from_json(const json &j, DeleteRangeResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
    v.num_deleted = j.value("num_deleted", int64_t{0});
}

void to_json(json &j, const ScanRequest &v)
{
    j = json{{"header", v.header},
             {"start_key", bytes_to_json(v.start_key)},
             {"end_key", bytes_to_json(v.end_key)},
             {"max_results", v.max_results}};
}
void from_json(const json &j, ScanRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.start_key = bytes_from_json(j, "start_key");
    v.end_key = bytes_from_json(j, "end_key");
    v.max_results = j.value("max_results", int64_t{0});
}
void to_json(json &j, const ScanResponse &v)
{
    j = json{{"header", v.header}, {"rows", v.rows}};
}
void from_json(const json &j, ScanResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
    v.rows = j.value("rows", std::vector<KeyValue>{});
}

void to_json(json &j, const EndTransactionRequest &v)
{
    json keys = json::array();
    for (const auto &key : v.keys)
        keys.push_back(bytes_to_json(key));
    j = json{{"header", v.header}, {"keys", std::move(keys)}, {"commit", v.commit}};
}
void from_json(const json &j, EndTransactionRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.keys.clear();
    for (const auto &key : j.at("keys"))
    {
        auto decoded = hex_decode(key.get_ref<const std::string &>());
        if (!decoded)
            throw std::invalid_argument("field 'keys' holds invalid hex");
        v.keys.push_back(std::move(*decoded));
    }
    v.commit = j.value("commit", false);
}
void to_json(json &j, const EndTransactionResponse &v)
{
    j = json{{"header", v.header}, {"commit_timestamp", v.commit_timestamp}};
}
void from_json(const json &j, EndTransactionResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
    v.commit_timestamp = j.value("commit_timestamp", int64_t{0});
}

void to_json(json &j, const AccumulateTSRequest &v)
{
    j = json{{"header", v.header}, {"key", bytes_to_json(v.key)}, {"counts", v.counts}};
}
void from_json(const json &j, AccumulateTSRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.key = bytes_from_json(j, "key");
    v.counts = j.at("counts").get<std::vector<int64_t>>();
}
void to_json(json &j, const AccumulateTSResponse &v)
{
    j = json{{"header", v.header}};
}
void from_json(const json &j, AccumulateTSResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
}

void to_json(json &j, const ReapQueueRequest &v)
{
    j = json{{"header", v.header}, {"inbox", bytes_to_json(v.inbox)}, {"max_results", v.max_results}};
}
void from_json(const json &j, ReapQueueRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.inbox = bytes_from_json(j, "inbox");
    v.max_results = j.value("max_results", int64_t{0});
}
void to_json(json &j, const ReapQueueResponse &v)
{
    j = json{{"header", v.header}, {"messages", v.messages}};
}
void from_json(const json &j, ReapQueueResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
    v.messages = j.value("messages", std::vector<Value>{});
}

void to_json(json &j, const EnqueueUpdateRequest &v)
{
    j = json{{"header", v.header}, {"key", bytes_to_json(v.key)}, {"update", v.update}};
}
void from_json(const json &j, EnqueueUpdateRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.key = bytes_from_json(j, "key");
    v.update = j.at("update").get<Value>();
}
void to_json(json &j, const EnqueueUpdateResponse &v)
{
    j = json{{"header", v.header}};
}
void from_json(const json &j, EnqueueUpdateResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
}

void to_json(json &j, const EnqueueMessageRequest &v)
{
    j = json{{"header", v.header}, {"inbox", bytes_to_json(v.inbox)}, {"message", v.message}};
}
void from_json(const json &j, EnqueueMessageRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.inbox = bytes_from_json(j, "inbox");
    v.message = j.at("message").get<Value>();
}
void to_json(json &j, const EnqueueMessageResponse &v)
{
    j = json{{"header", v.header}};
}
void from_json(const json &j, EnqueueMessageResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
}

void to_json(json &j, const InternalRangeLookupRequest &v)
{
    j = json{{"header", v.header}, {"key", bytes_to_json(v.key)}};
}
void from_json(const json &j, InternalRangeLookupRequest &v)
{
    v.header = j.at("header").get<RequestHeader>();
    v.key = bytes_from_json(j, "key");
}
void to_json(json &j, const InternalRangeLookupResponse &v)
{
    j = json{{"header", v.header}, {"locations", v.locations}};
}
void from_json(const json &j, InternalRangeLookupResponse &v)
{
    v.header = j.at("header").get<ResponseHeader>();
    v.locations = j.contains("locations") ? j["locations"].get<RangeLocations>() : RangeLocations{};
}

} // namespace rangekv::kv
