#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace mcp_tap {

// Keeps the sender's key order when payloads are pretty-printed
using Json = nlohmann::ordered_json;

// Hooks for one bottom-up rewrite of a JSON tree. Unset hooks leave the
// corresponding nodes alone.
struct TreeRewrite {
    // Arrays keep this many elements plus a "... +N more" marker
    std::size_t max_items = std::numeric_limits<std::size_t>::max();

    // Return true to drop a key. in_array is true when the owning object is
    // a direct element of an array.
    std::function<bool(const std::string& key, const Json& value, bool in_array)> drop_key;

    std::function<Json(const std::string&)> rewrite_string;
};

// Deepest nesting accepted from the wire. Serialising and rewriting recurse
// once per level, so deeper documents are treated as unparsable.
constexpr int kMaxJsonDepth = 512;

// Non-throwing parse; discarded for invalid text or nesting beyond
// kMaxJsonDepth
Json parse_bounded(const std::string& text);

Json rewrite_tree(const Json& node, const TreeRewrite& rules, bool in_array = false);

Json truncate_arrays(const Json& value, std::size_t max_items = 3);
Json truncate_string_values(const Json& value, std::size_t max_len = 100);

// Drops id, timestamp and empty graphql objects from array elements only
Json remove_noise_fields(const Json& value);

// Pretty-printed (2 spaces) and shortened form of text when it holds a JSON
// object or array, nullopt for anything else
std::optional<std::string> try_format_json(const std::string& text);

// Compact serialisation, invalid UTF-8 replaced rather than thrown
std::string dump_compact(const Json& value);
std::string dump_pretty(const Json& value);

// JavaScript-style truthiness: null, false, 0 and "" are false
bool is_truthy(const Json& value);

// Object or array with at least one element, or a non-empty string
bool has_content(const Json& value);

// Member of an object, or nullptr when value is not an object or lacks key
const Json* find_member(const Json& value, const std::string& key);

// String member, or fallback when missing, non-string or empty
std::string string_or(const Json& value, const std::string& key, const std::string& fallback);

} // namespace mcp_tap
