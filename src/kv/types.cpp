#include "kv/types.hpp"

#include <fmt/format.h>

namespace rangekv::kv
{

Key make_key(std::string_view prefix, std::string_view suffix)
{
    Key key;
    key.reserve(prefix.size() + suffix.size());
    key.append(prefix);
    key.append(suffix);
    return key;
}

bool is_meta2_key(std::string_view key) noexcept
{
    return key.substr(0, KeyMeta2Prefix.size()) == KeyMeta2Prefix;
}

std::string key_to_debug_string(std::string_view key)
{
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key)
    {
        if (c >= 0x20 && c < 0x7f && c != '\\')
            out += static_cast<char>(c);
        else
            out += fmt::format("\\x{:02x}", static_cast<unsigned int>(c));
    }
    return out;
}

} // namespace rangekv::kv
