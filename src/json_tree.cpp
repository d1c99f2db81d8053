#include "json_tree.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cstdint>

namespace mcp_tap {

Json parse_bounded(const std::string& text) {
    bool too_deep = false;
    Json::parser_callback_t limit = [&too_deep](int depth, Json::parse_event_t event, Json&) {
        if ((event == Json::parse_event_t::object_start ||
             event == Json::parse_event_t::array_start) && depth >= kMaxJsonDepth) {
            too_deep = true;
        }
        return !too_deep;
    };

    Json parsed = Json::parse(text, limit, false);
    if (too_deep) {
        return Json(Json::value_t::discarded);
    }
    return parsed;
}

Json rewrite_tree(const Json& node, const TreeRewrite& rules, bool in_array) {
    if (node.is_array()) {
        Json out = Json::array();
        std::size_t kept = std::min(node.size(), rules.max_items);
        for (std::size_t i = 0; i < kept; ++i) {
            out.push_back(rewrite_tree(node[i], rules, true));
        }
        if (node.size() > kept) {
            out.push_back("... +" + std::to_string(node.size() - kept) + " more");
        }
        return out;
    }

    if (node.is_object()) {
        Json out = Json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (rules.drop_key && rules.drop_key(it.key(), it.value(), in_array)) {
                continue;
            }
            out[it.key()] = rewrite_tree(it.value(), rules, false);
        }
        return out;
    }

    if (node.is_string() && rules.rewrite_string) {
        return rules.rewrite_string(node.get_ref<const std::string&>());
    }

    return node;
}

Json truncate_arrays(const Json& value, std::size_t max_items) {
    TreeRewrite rules;
    rules.max_items = max_items;
    return rewrite_tree(value, rules);
}

Json truncate_string_values(const Json& value, std::size_t max_len) {
    TreeRewrite rules;
    rules.rewrite_string = [max_len](const std::string& s) -> Json {
        return truncate(s, max_len);
    };
    return rewrite_tree(value, rules);
}

Json remove_noise_fields(const Json& value) {
    TreeRewrite rules;
    rules.drop_key = [](const std::string& key, const Json& v, bool in_array) {
        if (!in_array) return false;
        if (key == "id" || key == "timestamp") return true;
        return key == "graphql" && v.is_object() && v.empty();
    };
    return rewrite_tree(value, rules);
}

std::optional<std::string> try_format_json(const std::string& text) {
    Json parsed = parse_bounded(text);
    if (parsed.is_discarded()) return std::nullopt;
    if (!parsed.is_object() && !parsed.is_array()) return std::nullopt;

    Json shortened = truncate_string_values(remove_noise_fields(truncate_arrays(parsed)));
    return dump_pretty(shortened);
}

std::string dump_compact(const Json& value) {
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string dump_pretty(const Json& value) {
    return value.dump(2, ' ', false, Json::error_handler_t::replace);
}

bool is_truthy(const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return false;
        case Json::value_t::boolean:
            return value.get<bool>();
        case Json::value_t::number_integer:
            return value.get<int64_t>() != 0;
        case Json::value_t::number_unsigned:
            return value.get<uint64_t>() != 0;
        case Json::value_t::number_float: {
            double d = value.get<double>();
            return d == d && d != 0.0;
        }
        case Json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return true;
    }
}

bool has_content(const Json& value) {
    if (value.is_object() || value.is_array() || value.is_string()) {
        return !value.empty() && is_truthy(value);
    }
    return false;
}

const Json* find_member(const Json& value, const std::string& key) {
    if (!value.is_object()) return nullptr;
    auto it = value.find(key);
    if (it == value.end()) return nullptr;
    return &*it;
}

std::string string_or(const Json& value, const std::string& key, const std::string& fallback) {
    const Json* member = find_member(value, key);
    if (!member || !member->is_string()) return fallback;
    const auto& s = member->get_ref<const std::string&>();
    return s.empty() ? fallback : s;
}

} // namespace mcp_tap
