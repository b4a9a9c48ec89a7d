#include "path_builder.hpp"
#include <stdexcept>

namespace dtree {

dispatch_node& extend(dispatch_node& root, const path& p) {
    for (const auto& s : p) {
        if (!s.filter) throw std::invalid_argument("extend: path step without a filter");
    }

    // A freshly attached shared subtree is only cloned once a later step
    // needs to change it; as the last step it stays shared.
    dispatch_node* owner = &root;
    dispatch_node::cell* cursor = nullptr;

    for (const auto& s : p) {
        dispatch_node& current = cursor ? cursor->make_mutable() : *owner;
        auto& children = current.edges(s.op);

        auto it = children.find(s.filter);
        if (it == children.end()) {
            auto child = s.subtree ? dispatch_node::cell(s.subtree, false)
                                   : dispatch_node::cell::make_owned();
            it = children.emplace(s.filter, std::move(child)).first;
        } else {
            it->second.make_mutable();
        }
        cursor = &it->second;
    }

    return root;
}

path_builder& path_builder::step(combinator op, filter_ptr f,
                                 std::shared_ptr<dispatch_node> subtree) {
    if (!f) throw std::invalid_argument("path_builder: null filter");
    m_steps.push_back({op, std::move(f), std::move(subtree)});
    return *this;
}

} // namespace dtree
