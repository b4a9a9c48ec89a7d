#pragma once

#include "filter.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace dtree {

// Filters over events carrying an nlohmann::json payload. An event of any
// other type never matches. Fields are top-level keys, or JSON pointers
// when they start with '/'.

// Field lookup shared by the filters below. Null when absent.
const nlohmann::json* find_field(const nlohmann::json& event, const std::string& field);

// Passes when the event's JSON type is `kind`
// (object, array, string, number, boolean, null).
class json_kind_filter final : public filter {
public:
    // Throws std::invalid_argument on an unknown kind.
    explicit json_kind_filter(std::string kind);

    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter& other) const override;
    std::size_t hash() const override;
    std::string describe() const override { return "kind(" + m_kind + ")"; }

private:
    std::string m_kind;
};

class has_field_filter final : public filter {
public:
    explicit has_field_filter(std::string field) : m_field(std::move(field)) {}

    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter& other) const override;
    std::size_t hash() const override;
    std::string describe() const override { return "has_field(" + m_field + ")"; }

private:
    std::string m_field;
};

class field_equals_filter final : public filter {
public:
    field_equals_filter(std::string field, nlohmann::json value)
        : m_field(std::move(field)), m_value(std::move(value)) {}

    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter& other) const override;
    std::size_t hash() const override;
    std::string describe() const override { return m_field + " == " + m_value.dump(); }

private:
    std::string m_field;
    nlohmann::json m_value;
};

// Handler: logs the event and passes with {"handled_by": label}.
class log_filter final : public filter {
public:
    log_filter(std::string label, std::shared_ptr<spdlog::logger> log)
        : m_label(std::move(label)), m_log(std::move(log)) {}

    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter& other) const override;
    std::size_t hash() const override;
    std::string describe() const override { return "log(" + m_label + ")"; }

private:
    std::string m_label;
    std::shared_ptr<spdlog::logger> m_log;
};

// Throws std::runtime_error(message) on every evaluation.
class raise_filter final : public filter {
public:
    explicit raise_filter(std::string message) : m_message(std::move(message)) {}

    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter& other) const override;
    std::size_t hash() const override;
    std::string describe() const override { return "raise(" + m_message + ")"; }

private:
    std::string m_message;
};

// Passes when context.error is a std::exception whose what() contains `text`.
class error_contains_filter final : public filter {
public:
    explicit error_contains_filter(std::string text) : m_text(std::move(text)) {}

    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter& other) const override;
    std::size_t hash() const override;
    std::string describe() const override { return "error_contains(" + m_text + ")"; }

private:
    std::string m_text;
};

} // namespace dtree
