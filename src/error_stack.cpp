#include "error_stack.hpp"

namespace dtree {

void error_stack::push(std::exception_ptr err) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errors.push_back(std::move(err));
}

std::optional<std::exception_ptr> error_stack::pop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_errors.empty()) return std::nullopt;
    auto err = std::move(m_errors.back());
    m_errors.pop_back();
    return err;
}

std::vector<std::exception_ptr> error_stack::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errors;
}

std::size_t error_stack::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errors.size();
}

std::string describe_error(const std::exception_ptr& err) {
    if (!err) return "<none>";
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "<non-standard exception>";
    }
}

} // namespace dtree
