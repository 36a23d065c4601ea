#pragma once
/**
 * @file types.hpp
 * @brief Core data model: keys, replicas, range locations and values.
 *
 * Keys are opaque byte strings ordered lexicographically by unsigned byte.
 * `std::string` compares through `char_traits<char>::compare`, which is
 * defined in terms of memcmp, so std::string ordering already is unsigned
 * byte order.
 *
 * ## Metadata addressing
 *
 * Range locations are stored as ordinary values in two reserved namespaces:
 *
 *   KeyMeta1Prefix + <end key of a level-2 range>  -> RangeLocations
 *                    (the end key itself starts with KeyMeta2Prefix)
 *   KeyMeta2Prefix + <end key of a user range>     -> RangeLocations
 *
 * Resolving a user key takes exactly two lookups: level-1 gives the replicas
 * of the level-2 range holding (KeyMeta2Prefix + key), level-2 gives the
 * replicas of the user range holding key.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rangekv_core_export.h"

namespace rangekv::kv
{

using Key = std::string;

/// Smallest possible key.
inline const Key KeyMin{};

/// Sorts after every user key.
inline const Key KeyMax(4, '\xff');

/// Reserved prefix of all system keys.
inline const Key KeySystemPrefix{"\x00\x00", 2};

/// Level-1 range metadata: locates the level-2 ranges.
inline const Key KeyMeta1Prefix = KeySystemPrefix + "meta1";

/// Level-2 range metadata: locates user ranges.
inline const Key KeyMeta2Prefix = KeySystemPrefix + "meta2";

/**
 * @brief Concatenates key parts, e.g. make_key(KeyMeta2Prefix, user_key).
 */
RANGEKV_CORE_EXPORT Key make_key(std::string_view prefix, std::string_view suffix);

/**
 * @brief True if @p key lies in the level-2 metadata namespace.
 */
RANGEKV_CORE_EXPORT bool is_meta2_key(std::string_view key) noexcept;

/**
 * @brief Printable form of a key for log lines (non-printable bytes as \xNN).
 */
RANGEKV_CORE_EXPORT std::string key_to_debug_string(std::string_view key);

/**
 * @struct Replica
 * @brief One copy of a range on a storage node.
 */
struct Replica
{
    int32_t node_id{0};
    std::optional<int32_t> store_id;

    bool operator==(const Replica &other) const = default;
};

/**
 * @struct RangeLocations
 * @brief The replicas holding the key range [start_key, end_key).
 *
 * An absent end_key means the range is unbounded above.
 */
struct RangeLocations
{
    Key start_key;
    std::optional<Key> end_key;
    std::vector<Replica> replicas;

    [[nodiscard]] bool contains(std::string_view key) const noexcept
    {
        if (key < std::string_view(start_key))
            return false;
        return !end_key || key < std::string_view(*end_key);
    }

    bool operator==(const RangeLocations &other) const = default;
};

/**
 * @struct RangeMetadata
 * @brief Boundaries of a range, used when writing its location records.
 */
struct RangeMetadata
{
    Key start_key;
    Key end_key;
};

/**
 * @struct Value
 * @brief A stored value with its write timestamp (ns since epoch).
 */
struct Value
{
    std::string bytes;
    int64_t timestamp{0};

    bool operator==(const Value &other) const = default;
};

struct KeyValue
{
    Key key;
    Value value;
};

} // namespace rangekv::kv
