#include "toolmux/client/tool_cache.hpp"
#include "toolmux/log/logger.hpp"

#include <algorithm>
#include <mutex>

namespace toolmux {

bool ToolCache::replace(const std::string& server_id, std::vector<ToolSchema> tools, std::uint64_t generation) {
    std::unique_lock lock(mutex_);

    const auto it = entries_.find(server_id);
    if ((it != entries_.end()) && (it->second.generation > generation)) {
        get_logger().debug_fmt("{}: ignoring tool list from generation {} (have {})",
            server_id, generation, it->second.generation);
        return false;
    }

    const auto count = tools.size();
    entries_[server_id] = ToolCacheEntry{std::move(tools), generation, false};
    lock.unlock();

    get_logger().debug_fmt("{}: cached {} tools (generation {})", server_id, count, generation);
    return true;
}

void ToolCache::mark_stale(const std::string& server_id) {
    std::unique_lock lock(mutex_);
    const auto it = entries_.find(server_id);
    if (it != entries_.end()) {
        it->second.stale = true;
    }
}

void ToolCache::invalidate(const std::string& server_id) {
    std::unique_lock lock(mutex_);
    entries_.erase(server_id);
}

void ToolCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

std::optional<ToolCacheEntry> ToolCache::entry(const std::string& server_id) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(server_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ToolSchema> ToolCache::tools(const std::string& server_id) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(server_id);
    if (it == entries_.end()) {
        return {};
    }
    return it->second.tools;
}

std::optional<ToolSchema> ToolCache::find(const std::string& server_id, const std::string& tool_name) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(server_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const auto& tools = it->second.tools;
    const auto match = std::find_if(tools.begin(), tools.end(),
        [&tool_name](const ToolSchema& tool) { return tool.name == tool_name; });
    if (match == tools.end()) {
        return std::nullopt;
    }
    return *match;
}

bool ToolCache::contains(const std::string& server_id, const std::string& tool_name) const {
    return find(server_id, tool_name).has_value();
}

bool ToolCache::is_stale(const std::string& server_id) const {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(server_id);
    return (it != entries_.end()) && it->second.stale;
}

std::vector<std::string> ToolCache::server_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

}  // namespace toolmux
