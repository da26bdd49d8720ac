#pragma once

#include "errors.hpp"
#include "path_pattern.hpp"
#include "pattern_node.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pathtrie {

// Maps path patterns ("root.sg.*.s1", "root.**") to sets of values and
// answers which registered patterns overlap a concrete path.
//
// The value set type, merge logic, split logic and value serializer are all
// supplied by the caller. An empty merge (split) function makes append
// (remove) throw unsupported_operation, which gives a read-only index.
//
// Not thread-safe: callers must serialize every call against one instance,
// queries included.
template <typename V, typename Serializer, typename ValueSet = std::unordered_set<V>>
class pattern_tree_map {
public:
    using value_type = V;
    using node_type = pattern_node<V, ValueSet>;
    using value_set_factory = std::function<ValueSet()>;
    using value_function = typename node_type::value_function;

    pattern_tree_map(value_set_factory factory,
                     value_function merge,
                     value_function split,
                     Serializer serializer = Serializer{})
        : m_factory(std::move(factory)),
          m_merge(std::move(merge)),
          m_split(std::move(split)),
          m_serializer(std::move(serializer)),
          m_roots(std::string(), m_factory())
    {}

    pattern_tree_map(const pattern_tree_map&) = delete;
    pattern_tree_map& operator=(const pattern_tree_map&) = delete;

    // Register `value` under `pattern`. Segments become node names verbatim,
    // wildcards included. If the merge function throws, nodes created by this
    // call are removed again.
    void append(const path& pattern, const V& value) {
        if (!m_merge) throw unsupported_operation("append: no merge function configured");
        validate_pattern(pattern);

        node_type* cur = &m_roots;
        node_type* first_parent = nullptr;
        std::size_t first_created = 0;
        for (std::size_t i = 0; i < pattern.size(); ++i) {
            node_type* next = cur->get_child(pattern[i]);
            if (!next) {
                if (!first_parent) {
                    first_parent = cur;
                    first_created = i;
                }
                next = &cur->add_child(
                    std::make_unique<node_type>(pattern[i], m_factory()));
            }
            cur = next;
        }

        try {
            cur->append_value(value, m_merge);
        } catch (...) {
            if (first_parent) first_parent->remove_child(pattern[first_created]);
            throw;
        }
    }

    // Unregister `value` from exactly `pattern` (no wildcard expansion).
    // Nodes left without values and children are pruned bottom-up. Removing
    // something that is not registered is a no-op.
    void remove(const path& pattern, const V& value) {
        if (!m_split) throw unsupported_operation("remove: no split function configured");
        validate_pattern(pattern);

        node_type* root = m_roots.get_child(pattern[0]);
        if (!root) return;
        if (remove_node(*root, pattern, 0, value)) {
            m_roots.remove_child(pattern[0]);
        }
    }

    // Values of every pattern overlapping the concrete `full_path`,
    // de-duplicated.
    std::vector<V> get_overlapped(const path& full_path) const {
        validate_concrete(full_path);
        ValueSet res = m_factory();
        for (auto* root : m_roots.match_children(full_path[0])) {
            search_overlapped(*root, full_path, 0, res);
        }
        return std::vector<V>(res.begin(), res.end());
    }

    // Batch form of get_overlapped for several measurements under one
    // device: element i equals get_overlapped(device + measurements[i]).
    std::vector<std::vector<V>> get_overlapped(const path& device,
                                               const std::vector<std::string>& measurements) const {
        validate_concrete(device);
        for (const auto& m : measurements) {
            if (m.empty() || is_wildcard(m)) {
                throw invalid_path("invalid measurement '" + m + "'");
            }
        }

        std::vector<ValueSet> sets;
        sets.reserve(measurements.size());
        for (std::size_t i = 0; i < measurements.size(); ++i) sets.push_back(m_factory());

        for (auto* root : m_roots.match_children(device[0])) {
            search_overlapped(*root, device, 0, measurements, sets);
        }

        std::vector<std::vector<V>> res;
        res.reserve(sets.size());
        for (const auto& s : sets) res.emplace_back(s.begin(), s.end());
        return res;
    }

    // Values that may apply to some measurement of `device`.
    //
    // Attention: this over-approximates. Everything stored on the device
    // node and on any of its children is returned, so a value in the result
    // does not necessarily belong to the device; a value missing from the
    // result definitely does not.
    std::vector<V> get_device_overlapped(const path& device) const {
        validate_concrete(device);
        ValueSet res = m_factory();
        for (auto* root : m_roots.match_children(device[0])) {
            search_device_overlapped(*root, device, 0, res);
        }
        return std::vector<V>(res.begin(), res.end());
    }

    // Visit every (pattern, value) registration.
    void for_each(const std::function<void(const path&, const V&)>& fn) const {
        path prefix;
        for (const auto& [name, root] : m_roots.children()) {
            visit(*root, prefix, fn);
        }
    }

    bool empty() const { return m_roots.is_leaf(); }

    // Number of trie nodes, roots included.
    std::size_t node_count() const { return count_nodes(m_roots) - 1; }

    // For persistence collaborators; the map itself never serializes.
    const Serializer& serializer() const { return m_serializer; }

    bool can_append() const { return static_cast<bool>(m_merge); }
    bool can_remove() const { return static_cast<bool>(m_split); }

private:
    // Returns true when `node` should be pruned by its parent.
    bool remove_node(node_type& node, const path& pattern, std::size_t pos, const V& value) {
        if (pos == pattern.size() - 1) {
            node.delete_value(value, m_split);
        } else {
            const auto& next_name = pattern[pos + 1];
            node_type* child = node.get_child(next_name);
            if (!child) return false;
            if (remove_node(*child, pattern, pos + 1, value)) {
                node.remove_child(next_name);
            }
        }
        return node.is_prunable();
    }

    void search_overlapped(const node_type& node, const path& nodes, std::size_t pos,
                           ValueSet& res) const {
        if (pos == nodes.size() - 1) {
            node.collect_terminal(res);
            return;
        }
        // "**" may swallow the next segment without descending
        if (node.is_multi_level_wildcard()) {
            search_overlapped(node, nodes, pos + 1, res);
        }
        for (auto* child : node.match_children(nodes[pos + 1])) {
            search_overlapped(*child, nodes, pos + 1, res);
        }
    }

    void search_overlapped(const node_type& node, const path& device, std::size_t pos,
                           const std::vector<std::string>& measurements,
                           std::vector<ValueSet>& res) const {
        if (pos == device.size() - 1) {
            for (std::size_t i = 0; i < measurements.size(); ++i) {
                for (auto* child : node.match_children(measurements[i])) {
                    child->collect_terminal(res[i]);
                }
                if (node.is_multi_level_wildcard()) {
                    node.collect_terminal(res[i]);
                }
            }
            return;
        }
        if (node.is_multi_level_wildcard()) {
            search_overlapped(node, device, pos + 1, measurements, res);
        }
        for (auto* child : node.match_children(device[pos + 1])) {
            search_overlapped(*child, device, pos + 1, measurements, res);
        }
    }

    void search_device_overlapped(const node_type& node, const path& device, std::size_t pos,
                                  ValueSet& res) const {
        if (pos == device.size() - 1) {
            node.collect_terminal(res);
            for (const auto& [name, child] : node.children()) {
                child->collect_terminal(res);
            }
            return;
        }
        if (node.is_multi_level_wildcard()) {
            search_device_overlapped(node, device, pos + 1, res);
        }
        for (auto* child : node.match_children(device[pos + 1])) {
            search_device_overlapped(*child, device, pos + 1, res);
        }
    }

    void visit(const node_type& node, path& prefix,
               const std::function<void(const path&, const V&)>& fn) const {
        prefix.push_back(node.name());
        for (const auto& v : node.values()) fn(prefix, v);
        for (const auto& [name, child] : node.children()) {
            visit(*child, prefix, fn);
        }
        prefix.pop_back();
    }

    static std::size_t count_nodes(const node_type& node) {
        std::size_t n = 1;
        for (const auto& [name, child] : node.children()) n += count_nodes(*child);
        return n;
    }

    value_set_factory m_factory;
    value_function m_merge;
    value_function m_split;
    Serializer m_serializer;

    // Sentinel whose children are the roots, keyed by first segment.
    node_type m_roots;
};

} // namespace pathtrie
