#include "filters.hpp"
#include <stdexcept>

namespace dtree {

asio::awaitable<outcome> unit_filter::evaluate(context /*ctx*/) const {
    co_return outcome::pass();
}

std::size_t unit_filter::hash() const {
    return typeid(unit_filter).hash_code();
}

asio::awaitable<outcome> type_filter::evaluate(context ctx) const {
    if (std::type_index(ctx.event().type()) == m_target) {
        co_return outcome::pass();
    }
    co_return outcome::no_match();
}

bool type_filter::equals(const filter& other) const {
    return static_cast<const type_filter&>(other).m_target == m_target;
}

std::size_t type_filter::hash() const {
    return hash_combine(typeid(type_filter).hash_code(), m_target.hash_code());
}

std::string type_filter::describe() const {
    return std::string("type_is(") + m_target.name() + ")";
}

function_filter::function_filter(std::string name, function_type fn)
    : m_name(std::move(name))
{
    if (!fn) throw std::invalid_argument("function_filter: empty function");
    m_fn = std::make_shared<const function_type>(std::move(fn));
}

asio::awaitable<outcome> function_filter::evaluate(context ctx) const {
    co_return co_await (*m_fn)(std::move(ctx));
}

bool function_filter::equals(const filter& other) const {
    return static_cast<const function_filter&>(other).m_fn == m_fn;
}

std::size_t function_filter::hash() const {
    return std::hash<const void*>{}(m_fn.get());
}

predicate_filter::predicate_filter(std::string name, predicate_type pred)
    : m_name(std::move(name))
{
    if (!pred) throw std::invalid_argument("predicate_filter: empty predicate");
    m_pred = std::make_shared<const predicate_type>(std::move(pred));
}

asio::awaitable<outcome> predicate_filter::evaluate(context ctx) const {
    co_return (*m_pred)(ctx) ? outcome::pass() : outcome::no_match();
}

bool predicate_filter::equals(const filter& other) const {
    return static_cast<const predicate_filter&>(other).m_pred == m_pred;
}

std::size_t predicate_filter::hash() const {
    return std::hash<const void*>{}(m_pred.get());
}

asio::awaitable<outcome> reraise_filter::evaluate(context ctx) const {
    if (auto err = ctx.error()) {
        co_return outcome::fail(err);
    }
    co_return outcome::no_match();
}

std::size_t reraise_filter::hash() const {
    return typeid(reraise_filter).hash_code();
}

filter_ptr unit() {
    return std::make_shared<unit_filter>();
}

filter_ptr reraise() {
    return std::make_shared<reraise_filter>();
}

filter_ptr call(std::string name, function_filter::function_type fn) {
    return std::make_shared<function_filter>(std::move(name), std::move(fn));
}

filter_ptr when(std::string name, predicate_filter::predicate_type pred) {
    return std::make_shared<predicate_filter>(std::move(name), std::move(pred));
}

} // namespace dtree
