#pragma once

#include "toolmux/protocol/mcp_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// Tool Cache
// ─────────────────────────────────────────────────────────────────────────────
// server id -> last successful tools/list snapshot. Every write replaces a
// whole entry; readers always see a complete list from one discovery.
//
// An entry is tagged with the connection generation that discovered it. A
// write from an older generation than the stored one is refused, so a slow
// discovery from a dead connection cannot overwrite a fresh snapshot.

struct ToolCacheEntry {
    std::vector<ToolSchema> tools;  // discovery order
    std::uint64_t generation{0};
    bool stale{false};
};

class ToolCache {
public:
    ToolCache() = default;

    ToolCache(const ToolCache&) = delete;
    ToolCache& operator=(const ToolCache&) = delete;

    /// Returns false if a newer generation is already cached.
    bool replace(const std::string& server_id, std::vector<ToolSchema> tools, std::uint64_t generation);

    /// Keep the snapshot but flag it as possibly outdated.
    void mark_stale(const std::string& server_id);

    /// Drop the snapshot (reconnect, disconnect).
    void invalidate(const std::string& server_id);

    void clear();

    [[nodiscard]] std::optional<ToolCacheEntry> entry(const std::string& server_id) const;

    /// Empty when nothing is cached.
    [[nodiscard]] std::vector<ToolSchema> tools(const std::string& server_id) const;

    [[nodiscard]] std::optional<ToolSchema> find(const std::string& server_id, const std::string& tool_name) const;
    [[nodiscard]] bool contains(const std::string& server_id, const std::string& tool_name) const;
    [[nodiscard]] bool is_stale(const std::string& server_id) const;

    /// Sorted by id.
    [[nodiscard]] std::vector<std::string> server_ids() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ToolCacheEntry> entries_;
};

}  // namespace toolmux
