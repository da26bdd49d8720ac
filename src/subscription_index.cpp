#include "subscription_index.hpp"
#include "errors.hpp"
#include "registration_store.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <limits>

namespace pathtrie {

subscription_index::subscription_index(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_tree(make_subscription_map())
{}

uint64_t subscription_index::subscribe(const std::string& pattern,
                                       const std::string& client_id) {
    // Parse first: throws before any state is touched
    path parsed = parse_path(pattern);
    std::string key = join_path(parsed);

    std::lock_guard<std::mutex> lock(m_mutex);

    // Pattern already registered: lease-only change, tree untouched
    auto it = m_pattern_to_id.find(key);
    if (it != m_pattern_to_id.end()) {
        auto& sub = m_subscriptions[it->second];
        sub.lease_holders.insert(client_id);
        m_log->info("Reused subscription {} for pattern '{}', client '{}'",
                   it->second, key, client_id);
        return it->second;
    }

    uint64_t id = m_next_id;
    m_tree.append(parsed, id);
    ++m_next_id;

    subscription_info info;
    info.id = id;
    info.pattern = key;
    info.lease_holders.insert(client_id);

    m_subscriptions[id] = std::move(info);
    m_pattern_to_id[key] = id;

    m_log->info("New subscription {} for pattern '{}', client '{}'",
               id, key, client_id);
    return id;
}

bool subscription_index::remove_lease(uint64_t subscription_id,
                                      const std::string& client_id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_subscriptions.find(subscription_id);
    if (it == m_subscriptions.end()) return false;

    it->second.lease_holders.erase(client_id);

    if (it->second.lease_holders.empty()) {
        // No more clients, unregister the pattern
        m_tree.remove(parse_path(it->second.pattern), subscription_id);
        m_pattern_to_id.erase(it->second.pattern);
        m_log->info("Removed subscription {} (pattern '{}') - no active leases",
                   subscription_id, it->second.pattern);
        m_subscriptions.erase(it);
        return true;
    }

    m_log->debug("Removed lease for client '{}' on subscription {}, {} leases remain",
                client_id, subscription_id, it->second.lease_holders.size());
    return false;
}

bool subscription_index::remove_subscription(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_subscriptions.find(subscription_id);
    if (it == m_subscriptions.end()) return false;

    m_tree.remove(parse_path(it->second.pattern), subscription_id);
    m_pattern_to_id.erase(it->second.pattern);
    m_log->info("Force-removed subscription {} (pattern '{}')",
               subscription_id, it->second.pattern);
    m_subscriptions.erase(it);
    return true;
}

std::optional<subscription_info> subscription_index::get_subscription(uint64_t id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_subscriptions.find(id);
    if (it != m_subscriptions.end()) return it->second;
    return std::nullopt;
}

std::optional<uint64_t> subscription_index::find_by_pattern(const std::string& pattern) const {
    std::string key = join_path(parse_path(pattern));

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pattern_to_id.find(key);
    if (it != m_pattern_to_id.end()) return it->second;
    return std::nullopt;
}

std::vector<uint64_t> subscription_index::match(const std::string& full_path) const {
    path parsed = parse_path(full_path);

    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tree.get_overlapped(parsed);
}

std::vector<std::vector<uint64_t>> subscription_index::match(
    const std::string& device, const std::vector<std::string>& measurements) const {
    path parsed = parse_path(device);

    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tree.get_overlapped(parsed, measurements);
}

std::vector<uint64_t> subscription_index::match_device(const std::string& device) const {
    path parsed = parse_path(device);

    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tree.get_device_overlapped(parsed);
}

void subscription_index::save(const std::string& file) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto subs = nlohmann::json::array();
    for (const auto& [id, sub] : m_subscriptions) {
        std::vector<std::string> holders(sub.lease_holders.begin(), sub.lease_holders.end());
        std::sort(holders.begin(), holders.end());
        subs.push_back({{"id", id}, {"pattern", sub.pattern}, {"lease_holders", holders}});
    }

    nlohmann::json doc = {
        {"version", registrations_version},
        {"next_id", m_next_id},
        {"subscriptions", std::move(subs)}
    };
    write_file_bytes(file, nlohmann::json::to_msgpack(doc));
    m_log->info("Saved {} subscriptions to '{}'", m_subscriptions.size(), file);
}

void subscription_index::load(const std::string& file) {
    auto doc = decode_document(read_file_bytes(file));

    // Decode everything before touching the current state
    std::vector<subscription_info> loaded;
    uint64_t next_id = 1;
    try {
        auto it = doc.find("subscriptions");
        if (it == doc.end() || !it->is_array()) {
            throw serialization_error("snapshot: 'subscriptions' must be a list");
        }
        if (auto n = doc.find("next_id"); n != doc.end()) next_id = n->get<uint64_t>();
        if (next_id == 0) throw serialization_error("snapshot: invalid next_id 0");

        std::unordered_set<uint64_t> seen_ids;
        std::unordered_set<std::string> seen_patterns;
        for (const auto& item : *it) {
            subscription_info info;
            info.id = item.at("id").get<uint64_t>();
            // 0 is never handed out and the maximum would wrap the id counter
            if (info.id == 0 || info.id == std::numeric_limits<uint64_t>::max()) {
                throw serialization_error("snapshot: invalid id " + std::to_string(info.id));
            }
            info.pattern = join_path(parse_path(item.at("pattern").get<std::string>()));
            for (const auto& holder : item.at("lease_holders")) {
                info.lease_holders.insert(holder.get<std::string>());
            }
            if (info.lease_holders.empty()) {
                throw serialization_error("snapshot: subscription " + std::to_string(info.id) +
                                          " has no lease holders");
            }
            if (!seen_ids.insert(info.id).second) {
                throw serialization_error("snapshot: duplicate id " + std::to_string(info.id));
            }
            if (!seen_patterns.insert(info.pattern).second) {
                throw serialization_error("snapshot: duplicate pattern '" + info.pattern + "'");
            }
            next_id = std::max(next_id, info.id + 1);
            loaded.push_back(std::move(info));
        }
    } catch (const nlohmann::json::exception& e) {
        throw serialization_error(std::string("snapshot: ") + e.what());
    } catch (const invalid_path& e) {
        throw serialization_error(std::string("snapshot: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    for (const auto& [id, sub] : m_subscriptions) {
        m_tree.remove(parse_path(sub.pattern), id);
    }
    m_subscriptions.clear();
    m_pattern_to_id.clear();

    for (auto& info : loaded) {
        m_tree.append(parse_path(info.pattern), info.id);
        m_pattern_to_id[info.pattern] = info.id;
        m_subscriptions[info.id] = std::move(info);
    }
    m_next_id = next_id;

    m_log->info("Loaded {} subscriptions from '{}'", m_subscriptions.size(), file);
}

std::size_t subscription_index::active_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscriptions.size();
}

std::size_t subscription_index::node_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tree.node_count();
}

} // namespace pathtrie
