#pragma once

#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dtree {

// Failures recorded during one publish, in the order they occurred.
// Shared by every branch of the fan-out; all access is serialized.
class error_stack {
public:
    void push(std::exception_ptr err);

    // Removes the most recent entry. Returns nullopt when empty.
    std::optional<std::exception_ptr> pop();

    // Copy of the current entries, oldest first.
    std::vector<std::exception_ptr> entries() const;

    std::size_t size() const;
    bool empty() const { return size() == 0; }

private:
    mutable std::mutex m_mutex;
    std::vector<std::exception_ptr> m_errors;
};

// what() of the stored exception, or a placeholder for non-std exceptions.
std::string describe_error(const std::exception_ptr& err);

} // namespace dtree
