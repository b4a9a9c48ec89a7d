#include "json_filters.hpp"
#include "error_stack.hpp"
#include <functional>
#include <stdexcept>

namespace dtree {

namespace {

const nlohmann::json* json_event(const context& ctx) {
    return std::any_cast<nlohmann::json>(&ctx.event());
}

const char* kind_of(const nlohmann::json& j) {
    if (j.is_object())  return "object";
    if (j.is_array())   return "array";
    if (j.is_string())  return "string";
    if (j.is_number())  return "number";
    if (j.is_boolean()) return "boolean";
    if (j.is_null())    return "null";
    return "unknown";
}

std::size_t string_hash(const std::type_info& type, const std::string& s) {
    return hash_combine(type.hash_code(), std::hash<std::string>{}(s));
}

} // namespace

const nlohmann::json* find_field(const nlohmann::json& event, const std::string& field) {
    if (!field.empty() && field.front() == '/') {
        nlohmann::json::json_pointer ptr;
        try {
            ptr = nlohmann::json::json_pointer(field);
        } catch (const nlohmann::json::parse_error&) {
            return nullptr;
        }
        if (!event.contains(ptr)) return nullptr;
        return &event.at(ptr);
    }

    if (!event.is_object()) return nullptr;
    auto it = event.find(field);
    return it != event.end() ? &*it : nullptr;
}

json_kind_filter::json_kind_filter(std::string kind) : m_kind(std::move(kind)) {
    if (m_kind != "object" && m_kind != "array" && m_kind != "string" &&
        m_kind != "number" && m_kind != "boolean" && m_kind != "null") {
        throw std::invalid_argument("json_kind_filter: unknown kind '" + m_kind + "'");
    }
}

asio::awaitable<outcome> json_kind_filter::evaluate(context ctx) const {
    auto* ev = json_event(ctx);
    co_return (ev && m_kind == kind_of(*ev)) ? outcome::pass() : outcome::no_match();
}

bool json_kind_filter::equals(const filter& other) const {
    return static_cast<const json_kind_filter&>(other).m_kind == m_kind;
}

std::size_t json_kind_filter::hash() const {
    return string_hash(typeid(json_kind_filter), m_kind);
}

asio::awaitable<outcome> has_field_filter::evaluate(context ctx) const {
    auto* ev = json_event(ctx);
    co_return (ev && find_field(*ev, m_field)) ? outcome::pass() : outcome::no_match();
}

bool has_field_filter::equals(const filter& other) const {
    return static_cast<const has_field_filter&>(other).m_field == m_field;
}

std::size_t has_field_filter::hash() const {
    return string_hash(typeid(has_field_filter), m_field);
}

asio::awaitable<outcome> field_equals_filter::evaluate(context ctx) const {
    auto* ev = json_event(ctx);
    if (!ev) co_return outcome::no_match();
    auto* value = find_field(*ev, m_field);
    co_return (value && *value == m_value) ? outcome::pass() : outcome::no_match();
}

bool field_equals_filter::equals(const filter& other) const {
    const auto& o = static_cast<const field_equals_filter&>(other);
    return o.m_field == m_field && o.m_value == m_value;
}

std::size_t field_equals_filter::hash() const {
    return hash_combine(string_hash(typeid(field_equals_filter), m_field),
                        std::hash<nlohmann::json>{}(m_value));
}

asio::awaitable<outcome> log_filter::evaluate(context ctx) const {
    if (auto* ev = json_event(ctx)) {
        m_log->info("[{}] {}", m_label, ev->dump());
    } else {
        m_log->info("[{}] <{}>", m_label, ctx.event().type().name());
    }
    co_return outcome::pass(delta{{"handled_by", std::any(m_label)}});
}

bool log_filter::equals(const filter& other) const {
    return static_cast<const log_filter&>(other).m_label == m_label;
}

std::size_t log_filter::hash() const {
    return string_hash(typeid(log_filter), m_label);
}

asio::awaitable<outcome> raise_filter::evaluate(context /*ctx*/) const {
    throw std::runtime_error(m_message);
    co_return outcome::no_match();
}

bool raise_filter::equals(const filter& other) const {
    return static_cast<const raise_filter&>(other).m_message == m_message;
}

std::size_t raise_filter::hash() const {
    return string_hash(typeid(raise_filter), m_message);
}

asio::awaitable<outcome> error_contains_filter::evaluate(context ctx) const {
    auto err = ctx.error();
    if (!err) co_return outcome::no_match();
    bool found = describe_error(err).find(m_text) != std::string::npos;
    co_return found ? outcome::pass() : outcome::no_match();
}

bool error_contains_filter::equals(const filter& other) const {
    return static_cast<const error_contains_filter&>(other).m_text == m_text;
}

std::size_t error_contains_filter::hash() const {
    return string_hash(typeid(error_contains_filter), m_text);
}

} // namespace dtree
