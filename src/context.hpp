#pragma once

#include <any>
#include <cstddef>
#include <exception>
#include <string>
#include <unordered_map>

namespace dtree {

// Values a filter adds to the context when it passes.
using delta = std::unordered_map<std::string, std::any>;

namespace keys {
inline constexpr const char* event = "event";
inline constexpr const char* error = "error";
} // namespace keys

// Key/value mapping threaded along a dispatch path.
// `event` is set once at construction; `error` only via with_error().
// Filters receive their own copy, so local changes never reach siblings.
class context {
public:
    context() = default;
    explicit context(std::any event);

    const std::any& event() const;

    // Null when the context is not propagating a failure.
    std::exception_ptr error() const;

    bool contains(const std::string& key) const;
    const std::any* find(const std::string& key) const;

    template <typename T>
    const T* get(const std::string& key) const {
        auto* value = find(key);
        return value ? std::any_cast<T>(value) : nullptr;
    }

    // Throws std::invalid_argument for the reserved keys.
    void set(const std::string& key, std::any value);

    // Right-merge: keys in `d` win. Reserved keys in `d` are skipped.
    context merged(const delta& d) const;

    context with_error(std::exception_ptr err) const;

    std::size_t size() const { return m_values.size(); }
    const std::unordered_map<std::string, std::any>& values() const { return m_values; }

    static bool is_reserved(const std::string& key);

private:
    std::unordered_map<std::string, std::any> m_values;
};

} // namespace dtree
