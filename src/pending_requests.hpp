#pragma once

#include "json_tree.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace mcp_tap {

struct PendingRequest {
    std::string method;
    std::optional<std::string> tool_name;   // tools/call only
    std::chrono::steady_clock::time_point started;
};

// Outstanding requests of one proxy session, keyed by JSON-RPC id.
// Ids of different JSON types never collide: 1 and "1" are distinct.
class PendingRequests {
public:
    // Reusing an id that is still outstanding replaces the earlier entry
    void add(const Json& id, PendingRequest request);

    std::optional<PendingRequest> find(const Json& id) const;
    bool contains(const Json& id) const;
    void remove(const Json& id);

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    static std::string key_for(const Json& id);

    std::map<std::string, PendingRequest> entries_;
};

} // namespace mcp_tap
