#pragma once

#include "path_pattern.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pathtrie {

// One segment of the pattern trie. The name is a literal, "*" or "**";
// wildcards are ordinary names in the child map and only get their meaning
// from match_children() at query time.
//
// A node exclusively owns its children. Destroying a node destroys its
// subtree.
template <typename V, typename ValueSet>
class pattern_node {
public:
    using child_map = std::unordered_map<std::string, std::unique_ptr<pattern_node>>;
    using value_function = std::function<void(const V&, ValueSet&)>;

    pattern_node(std::string name, ValueSet values)
        : m_name(std::move(name)),
          m_values(std::move(values)),
          m_multi_level(m_name == multi_level_wildcard),
          m_single_level(m_name == one_level_wildcard)
    {}

    pattern_node(const pattern_node&) = delete;
    pattern_node& operator=(const pattern_node&) = delete;

    const std::string& name() const { return m_name; }

    // Exact-name lookup, no wildcard expansion. nullptr when absent.
    pattern_node* get_child(const std::string& name) const {
        auto it = m_children.find(name);
        if (it == m_children.end()) return nullptr;
        return it->second.get();
    }

    // Insert under child->name(). An existing child with that name wins and
    // the argument is discarded; the stored child is returned either way.
    pattern_node& add_child(std::unique_ptr<pattern_node> child) {
        auto [it, inserted] = m_children.try_emplace(child->name(), std::move(child));
        return *it->second;
    }

    // Detach and destroy the named subtree. No-op when absent.
    void remove_child(const std::string& name) {
        m_children.erase(name);
    }

    // Children that can consume `segment`: the exact-name child, then "*",
    // then "**". Each appears at most once.
    std::vector<pattern_node*> match_children(const std::string& segment) const {
        std::vector<pattern_node*> res;
        res.reserve(3);
        if (auto* exact = get_child(segment)) res.push_back(exact);
        if (segment != one_level_wildcard) {
            if (auto* one = get_child(std::string(one_level_wildcard))) res.push_back(one);
        }
        if (segment != multi_level_wildcard) {
            if (auto* multi = get_child(std::string(multi_level_wildcard))) res.push_back(multi);
        }
        return res;
    }

    void append_value(const V& value, const value_function& merge) {
        merge(value, m_values);
    }

    void delete_value(const V& value, const value_function& split) {
        split(value, m_values);
    }

    // Add this node's values to `out`, plus those of a trailing "**" chain:
    // "a.**" also matches "a" itself.
    template <typename Out>
    void collect_terminal(Out& out) const {
        out.insert(m_values.begin(), m_values.end());
        if (auto* multi = get_child(std::string(multi_level_wildcard))) {
            multi->collect_terminal(out);
        }
    }

    bool is_leaf() const { return m_children.empty(); }
    bool is_multi_level_wildcard() const { return m_multi_level; }
    bool is_single_level_wildcard() const { return m_single_level; }

    // Leaf with no values left: the parent may prune it.
    bool is_prunable() const { return is_leaf() && m_values.empty(); }

    const ValueSet& values() const { return m_values; }
    const child_map& children() const { return m_children; }

private:
    std::string m_name;
    child_map m_children;
    ValueSet m_values;
    bool m_multi_level;
    bool m_single_level;
};

} // namespace pathtrie
