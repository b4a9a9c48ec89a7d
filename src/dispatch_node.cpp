#include "dispatch_node.hpp"
#include <unordered_set>
#include <vector>

namespace dtree {

std::optional<combinator> parse_combinator(const std::string& s) {
    if (s == "and")   return combinator::and_op;
    if (s == "or")    return combinator::or_op;
    if (s == "catch") return combinator::catch_op;
    return std::nullopt;
}

const char* to_string(combinator op) {
    switch (op) {
        case combinator::and_op:   return "and";
        case combinator::or_op:    return "or";
        case combinator::catch_op: return "catch";
    }
    return "?";
}

const dispatch_node::edge_map& dispatch_node::edges(combinator op) const {
    switch (op) {
        case combinator::and_op:   return m_ands;
        case combinator::or_op:    return m_ors;
        case combinator::catch_op: return m_catches;
    }
    return m_ands;
}

dispatch_node::edge_map& dispatch_node::edges(combinator op) {
    switch (op) {
        case combinator::and_op:   return m_ands;
        case combinator::or_op:    return m_ors;
        case combinator::catch_op: return m_catches;
    }
    return m_ands;
}

static dispatch_node::edge_map share_all(const dispatch_node::edge_map& src) {
    dispatch_node::edge_map out;
    out.reserve(src.size());
    for (const auto& [f, child] : src) {
        out.emplace(f, child.share_view());
    }
    return out;
}

dispatch_node dispatch_node::clone() const {
    dispatch_node copy;
    copy.m_ands = share_all(m_ands);
    copy.m_ors = share_all(m_ors);
    copy.m_catches = share_all(m_catches);
    return copy;
}

std::size_t count_nodes(const dispatch_node& root) {
    std::unordered_set<const dispatch_node*> seen;
    std::vector<const dispatch_node*> pending{&root};

    while (!pending.empty()) {
        const dispatch_node* n = pending.back();
        pending.pop_back();
        if (!seen.insert(n).second) continue;

        for (auto op : {combinator::and_op, combinator::or_op, combinator::catch_op}) {
            for (const auto& [f, child] : n->edges(op)) {
                pending.push_back(&child.view());
            }
        }
    }
    return seen.size();
}

} // namespace dtree
