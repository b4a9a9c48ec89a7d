#pragma once

#include "dispatch_node.hpp"
#include <memory>
#include <vector>

namespace dtree {

// One edge of a dispatch path. When `subtree` is set and the edge does not
// exist yet, the subtree is attached as a shared child instead of a new node.
struct path_step {
    combinator op;
    filter_ptr filter;
    std::shared_ptr<dispatch_node> subtree;
};

using path = std::vector<path_step>;

// Materialize `p` under `root`, reusing existing edges.
//
// Nodes along the way are made mutable before they are changed, so shared
// subtrees are cloned instead of modified. Re-adding an identical path is
// a no-op; the subtree of an edge that already exists is ignored.
// Not thread-safe: no dispatch may run over `root` concurrently.
dispatch_node& extend(dispatch_node& root, const path& p);

// Fluent accumulation of a path:
//
//   path_builder()
//       .and_then(type_is<std::string>())
//       .or_else(type_is<int>())
//       .and_then(call("record", record))
//       .end(root);
class path_builder {
public:
    // Throws std::invalid_argument on a null filter.
    path_builder& step(combinator op, filter_ptr f,
                       std::shared_ptr<dispatch_node> subtree = nullptr);

    path_builder& and_then(filter_ptr f, std::shared_ptr<dispatch_node> subtree = nullptr) {
        return step(combinator::and_op, std::move(f), std::move(subtree));
    }
    path_builder& or_else(filter_ptr f, std::shared_ptr<dispatch_node> subtree = nullptr) {
        return step(combinator::or_op, std::move(f), std::move(subtree));
    }
    path_builder& on_error(filter_ptr f, std::shared_ptr<dispatch_node> subtree = nullptr) {
        return step(combinator::catch_op, std::move(f), std::move(subtree));
    }

    const path& steps() const { return m_steps; }
    bool empty() const { return m_steps.empty(); }

    dispatch_node& end(dispatch_node& root) const { return extend(root, m_steps); }

private:
    path m_steps;
};

} // namespace dtree
