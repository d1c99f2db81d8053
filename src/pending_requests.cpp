#include "pending_requests.hpp"

namespace mcp_tap {

std::string PendingRequests::key_for(const Json& id) {
    return dump_compact(id);
}

void PendingRequests::add(const Json& id, PendingRequest request) {
    entries_[key_for(id)] = std::move(request);
}

std::optional<PendingRequest> PendingRequests::find(const Json& id) const {
    auto it = entries_.find(key_for(id));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool PendingRequests::contains(const Json& id) const {
    return entries_.count(key_for(id)) > 0;
}

void PendingRequests::remove(const Json& id) {
    entries_.erase(key_for(id));
}

} // namespace mcp_tap
