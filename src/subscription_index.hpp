#pragma once

#include "path_pattern.hpp"
#include "value_kinds.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pathtrie {

struct subscription_info {
    uint64_t id;
    std::string pattern;
    // Clients holding active leases for this subscription
    std::unordered_set<std::string> lease_holders;
};

// Manages path-pattern subscriptions in a pattern_tree_map of subscription
// ids. One pattern maps to one id; every client subscribing to it holds a
// lease, and the pattern is unregistered when the last lease goes.
//
// All calls, queries included, are serialized through one mutex since the
// tree itself is single-writer.
class subscription_index {
public:
    explicit subscription_index(std::shared_ptr<spdlog::logger> log);

    // Subscribe with a path pattern. Returns the subscription ID
    // (new or existing). Throws invalid_path on a malformed pattern.
    uint64_t subscribe(const std::string& pattern, const std::string& client_id);

    // Remove a specific client's lease from a subscription.
    // Returns true if the subscription was fully removed (no more lease holders).
    bool remove_lease(uint64_t subscription_id, const std::string& client_id);

    // Remove all leases for a subscription. Returns true if it existed.
    bool remove_subscription(uint64_t subscription_id);

    // Look up subscription by ID
    std::optional<subscription_info> get_subscription(uint64_t id) const;

    // Look up subscription ID by pattern text
    std::optional<uint64_t> find_by_pattern(const std::string& pattern) const;

    // Sorted IDs of subscriptions whose pattern overlaps the concrete path.
    std::vector<uint64_t> match(const std::string& full_path) const;

    // One sorted ID list per measurement under `device`.
    std::vector<std::vector<uint64_t>> match(const std::string& device,
                                             const std::vector<std::string>& measurements) const;

    // IDs that may concern any measurement of `device` (over-approximation).
    std::vector<uint64_t> match_device(const std::string& device) const;

    // Write all subscriptions to `file` / replace all subscriptions with the
    // contents of `file`. Throw serialization_error.
    void save(const std::string& file) const;
    void load(const std::string& file);

    // Stats
    std::size_t active_count() const;
    std::size_t node_count() const;

private:
    std::shared_ptr<spdlog::logger> m_log;

    // Serializes every call; the tree has no locking of its own.
    mutable std::mutex m_mutex;

    subscription_map m_tree;

    uint64_t m_next_id = 1;
    // Normalized pattern text -> id
    std::unordered_map<std::string, uint64_t> m_pattern_to_id;
    std::unordered_map<uint64_t, subscription_info> m_subscriptions;
};

} // namespace pathtrie
