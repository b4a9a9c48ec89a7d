#pragma once

#include "context.hpp"
#include <asio/awaitable.hpp>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <typeinfo>

namespace dtree {

enum class verdict {
    pass,
    no_match,
    fail
};

// Result of evaluating one filter against a context.
struct outcome {
    verdict kind = verdict::no_match;
    delta values;                 // only meaningful for verdict::pass
    std::exception_ptr error;     // only meaningful for verdict::fail

    static outcome pass(delta d = {}) { return {verdict::pass, std::move(d), nullptr}; }
    static outcome no_match() { return {verdict::no_match, {}, nullptr}; }
    static outcome fail(std::exception_ptr e) { return {verdict::fail, {}, std::move(e)}; }
};

// Unit of computation on a dispatch path.
//
// Filters are immutable values compared by structure: two filters are equal
// iff they were built from equal arguments. Equal filters must behave the
// same, since a node keeps only one edge per (combinator, filter).
// evaluate() may suspend; throwing is equivalent to returning fail().
class filter {
public:
    virtual ~filter() = default;

    virtual asio::awaitable<outcome> evaluate(context ctx) const = 0;

    // Called only with an argument of the same dynamic type.
    virtual bool equals(const filter& other) const = 0;
    virtual std::size_t hash() const = 0;

    // Short human-readable form for logs.
    virtual std::string describe() const = 0;
};

using filter_ptr = std::shared_ptr<const filter>;

struct filter_hash {
    std::size_t operator()(const filter_ptr& f) const {
        return f ? f->hash() : 0;
    }
};

struct filter_equal {
    bool operator()(const filter_ptr& a, const filter_ptr& b) const {
        if (a == b) return true;
        if (!a || !b) return false;
        return typeid(*a) == typeid(*b) && a->equals(*b);
    }
};

inline std::size_t hash_combine(std::size_t seed, std::size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // namespace dtree
