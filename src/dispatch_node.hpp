#pragma once

#include "cow_cell.hpp"
#include "filter.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace dtree {

// Edge kind between a node and its child.
enum class combinator {
    and_op,    // reached when the parent's filter passes (or fails)
    or_op,     // reached when the parent's filter does not match
    catch_op   // reached when the parent's filter fails
};

std::optional<combinator> parse_combinator(const std::string& s);
const char* to_string(combinator op);

// One node of the dispatch tree. Children may be shared between parents;
// each edge map holds at most one child per filter (by filter_equal).
class dispatch_node {
public:
    using cell = cow_cell<dispatch_node>;
    using edge_map = std::unordered_map<filter_ptr, cell, filter_hash, filter_equal>;

    const edge_map& edges(combinator op) const;
    edge_map& edges(combinator op);

    const edge_map& ands() const { return m_ands; }
    const edge_map& ors() const { return m_ors; }
    const edge_map& catches() const { return m_catches; }

    bool empty() const { return m_ands.empty() && m_ors.empty() && m_catches.empty(); }
    std::size_t edge_count() const { return m_ands.size() + m_ors.size() + m_catches.size(); }

    // Fresh copy of this node's maps; every child becomes a shared cell.
    dispatch_node clone() const;

private:
    edge_map m_ands;
    edge_map m_ors;
    edge_map m_catches;
};

// Number of distinct nodes reachable from `root`, root included.
std::size_t count_nodes(const dispatch_node& root);

} // namespace dtree
