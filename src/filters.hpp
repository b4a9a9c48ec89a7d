#pragma once

#include "filter.hpp"
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace dtree {

// Always passes with an empty delta. Used as the synthetic root edge.
class unit_filter final : public filter {
public:
    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter&) const override { return true; }
    std::size_t hash() const override;
    std::string describe() const override { return "unit"; }
};

// Passes when context.event holds exactly the given type.
class type_filter final : public filter {
public:
    explicit type_filter(std::type_index target) : m_target(target) {}

    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter& other) const override;
    std::size_t hash() const override;
    std::string describe() const override;

    std::type_index target() const { return m_target; }

private:
    std::type_index m_target;
};

// Delegates to a user coroutine. Equality is identity of the wrapped callable,
// so register the same filter_ptr (or a copy of it) to share an edge.
class function_filter final : public filter {
public:
    using function_type = std::function<asio::awaitable<outcome>(context)>;

    function_filter(std::string name, function_type fn);

    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter& other) const override;
    std::size_t hash() const override;
    std::string describe() const override { return "call(" + m_name + ")"; }

private:
    std::string m_name;
    std::shared_ptr<const function_type> m_fn;
};

// Passes when a synchronous predicate over the context holds.
class predicate_filter final : public filter {
public:
    using predicate_type = std::function<bool(const context&)>;

    predicate_filter(std::string name, predicate_type pred);

    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter& other) const override;
    std::size_t hash() const override;
    std::string describe() const override { return "when(" + m_name + ")"; }

private:
    std::string m_name;
    std::shared_ptr<const predicate_type> m_pred;
};

// Fails with context.error when present, otherwise no match.
class reraise_filter final : public filter {
public:
    asio::awaitable<outcome> evaluate(context ctx) const override;
    bool equals(const filter&) const override { return true; }
    std::size_t hash() const override;
    std::string describe() const override { return "reraise"; }
};

// True when `err` holds an exception of type E or one derived from it.
template <typename E>
bool holds_error(const std::exception_ptr& err) {
    if (!err) return false;
    try {
        std::rethrow_exception(err);
    } catch (const E&) {
        return true;
    } catch (...) {
        // Any other type, including non-std exceptions, is not an E
        return false;
    }
}

// Passes when context.error holds an E.
template <typename E>
class error_filter final : public filter {
public:
    asio::awaitable<outcome> evaluate(context ctx) const override {
        bool matched = holds_error<E>(ctx.error());
        co_return matched ? outcome::pass() : outcome::no_match();
    }
    bool equals(const filter&) const override { return true; }
    std::size_t hash() const override { return typeid(error_filter<E>).hash_code(); }
    std::string describe() const override {
        return std::string("error_is(") + typeid(E).name() + ")";
    }
};

filter_ptr unit();
filter_ptr reraise();
filter_ptr call(std::string name, function_filter::function_type fn);
filter_ptr when(std::string name, predicate_filter::predicate_type pred);

template <typename T>
filter_ptr type_is() {
    return std::make_shared<type_filter>(std::type_index(typeid(T)));
}

template <typename E>
filter_ptr error_is() {
    return std::make_shared<error_filter<E>>();
}

} // namespace dtree
