#include "context.hpp"
#include <stdexcept>

namespace dtree {

namespace {
const std::any empty_value;
} // namespace

context::context(std::any event) {
    m_values.emplace(keys::event, std::move(event));
}

const std::any& context::event() const {
    auto it = m_values.find(keys::event);
    return it != m_values.end() ? it->second : empty_value;
}

std::exception_ptr context::error() const {
    auto it = m_values.find(keys::error);
    if (it == m_values.end()) return nullptr;
    auto* err = std::any_cast<std::exception_ptr>(&it->second);
    return err ? *err : nullptr;
}

bool context::contains(const std::string& key) const {
    return m_values.count(key) != 0;
}

const std::any* context::find(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) return &it->second;
    return nullptr;
}

void context::set(const std::string& key, std::any value) {
    if (is_reserved(key)) {
        throw std::invalid_argument("context: key '" + key + "' is reserved");
    }
    m_values[key] = std::move(value);
}

context context::merged(const delta& d) const {
    context out(*this);
    for (const auto& [key, value] : d) {
        if (is_reserved(key)) continue;
        out.m_values[key] = value;
    }
    return out;
}

context context::with_error(std::exception_ptr err) const {
    context out(*this);
    out.m_values[keys::error] = std::move(err);
    return out;
}

bool context::is_reserved(const std::string& key) {
    return key == keys::event || key == keys::error;
}

} // namespace dtree
