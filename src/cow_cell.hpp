#pragma once

#include <memory>
#include <utility>

namespace dtree {

// Copy-on-write reference to a tree node.
//
// An owned cell is the only holder of its node and may mutate it in place.
// A shared cell must clone before mutating; T::clone() is expected to copy
// one level and hand out shared cells for everything below it.
template <typename T>
class cow_cell {
public:
    cow_cell(std::shared_ptr<T> value, bool owned)
        : m_value(std::move(value)), m_owned(owned) {}

    static cow_cell make_owned() { return cow_cell(std::make_shared<T>(), true); }

    const T& view() const { return *m_value; }

    // Clones the node first when it is shared. The cell then refers to the
    // clone, so references obtained from an earlier view() go stale.
    T& make_mutable() {
        if (!m_owned) {
            m_value = std::make_shared<T>(m_value->clone());
            m_owned = true;
        }
        return *m_value;
    }

    cow_cell share_view() const { return cow_cell(m_value, false); }

    bool owned() const { return m_owned; }
    const std::shared_ptr<T>& get() const { return m_value; }

private:
    std::shared_ptr<T> m_value;
    bool m_owned;
};

} // namespace dtree
