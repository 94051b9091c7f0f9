#pragma once

#include "cats/category.hpp"
#include "cats/errors.hpp"

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace cats {

// A finite set of T, compared extensionally. Iteration order is the order
// of T and therefore the same for equal sets.
template <typename T>
class FinSet {
public:
    typedef boost::container::flat_set<T> Storage;
    typedef typename Storage::const_iterator const_iterator;

    FinSet() = default;
    FinSet(std::initializer_list<T> elements) : elements_(elements) {}

    template <typename It>
    FinSet(It first, It last) : elements_(first, last) {}

    bool contains(const T& x) const { return elements_.find(x) != elements_.end(); }

    // Zero-based position of x in iteration order.
    boost::optional<std::size_t> index_of(const T& x) const {
        const_iterator it = elements_.find(x);
        if (it == elements_.end()) {
            return boost::none;
        }
        return static_cast<std::size_t>(std::distance(elements_.begin(), it));
    }

    std::size_t size() const { return elements_.size(); }
    bool empty() const { return elements_.empty(); }

    const_iterator begin() const { return elements_.begin(); }
    const_iterator end() const { return elements_.end(); }

    friend bool operator==(const FinSet& a, const FinSet& b) { return a.elements_ == b.elements_; }
    friend bool operator!=(const FinSet& a, const FinSet& b) { return !(a == b); }

    friend std::ostream& operator<<(std::ostream& out, const FinSet& s) {
        out << "{";
        for (const_iterator it = s.begin(); it != s.end(); ++it) {
            out << (it == s.begin() ? "" : ", ") << *it;
        }
        return out << "}";
    }

private:
    Storage elements_;
};

// A total function between two finite sets. The mapping covers exactly the
// domain and lands inside the codomain; the constructor enforces both.
template <typename T>
class FinFunction {
public:
    typedef boost::container::flat_map<T, T> Mapping;

    FinFunction(FinSet<T> dom, FinSet<T> codom, const std::vector<std::pair<T, T>>& pairs)
        : dom_(std::move(dom)), codom_(std::move(codom)) {
        for (const auto& [x, y] : pairs) {
            if (!dom_.contains(x)) {
                raise<invalid_morphism>("function maps " + describe(x) + " which is not in its domain");
            }
            if (!codom_.contains(y)) {
                raise<invalid_morphism>("function sends " + describe(x) + " to " + describe(y) +
                                        " which is not in its codomain");
            }
            if (!mapping_.emplace(x, y).second) {
                raise<invalid_morphism>("function maps " + describe(x) + " twice");
            }
        }
        if (mapping_.size() != dom_.size()) {
            raise<invalid_morphism>("function is not total: " + std::to_string(mapping_.size()) +
                                    " of " + std::to_string(dom_.size()) + " elements mapped");
        }
    }

    const FinSet<T>& dom() const { return dom_; }
    const FinSet<T>& codom() const { return codom_; }
    const Mapping& mapping() const { return mapping_; }

    boost::optional<T> find(const T& x) const {
        typename Mapping::const_iterator it = mapping_.find(x);
        if (it == mapping_.end()) {
            return boost::none;
        }
        return it->second;
    }

    T operator()(const T& x) const {
        boost::optional<T> y = find(x);
        if (!y) {
            raise<key_not_found>(describe(x) + " is not in the domain " + describe(dom_));
        }
        return *y;
    }

    friend bool operator==(const FinFunction& a, const FinFunction& b) {
        return a.dom_ == b.dom_ && a.codom_ == b.codom_ && a.mapping_ == b.mapping_;
    }

    friend bool operator!=(const FinFunction& a, const FinFunction& b) { return !(a == b); }

private:
    template <typename V>
    static std::string describe(const V& v) {
        return boost::lexical_cast<std::string>(v);
    }

    FinSet<T> dom_;
    FinSet<T> codom_;
    Mapping mapping_;
};

template <typename T>
class FinSetCategory : public Category<FinSet<T>, FinFunction<T>> {
public:
    static std::shared_ptr<const FinSetCategory> instance() {
        static const std::shared_ptr<const FinSetCategory> category = std::make_shared<FinSetCategory>();
        return category;
    }

    FinSet<T> dom(const FinFunction<T>& f) const override { return f.dom(); }

    FinSet<T> codom(const FinFunction<T>& f) const override { return f.codom(); }

    FinFunction<T> compose(const FinFunction<T>& f, const FinFunction<T>& g) const override {
        this->check_composable(f, g);
        std::vector<std::pair<T, T>> pairs;
        pairs.reserve(f.dom().size());
        for (const T& x : f.dom()) {
            pairs.emplace_back(x, g(f(x)));
        }
        return FinFunction<T>(f.dom(), g.codom(), pairs);
    }

    FinFunction<T> id(const FinSet<T>& x) const override {
        std::vector<std::pair<T, T>> pairs;
        pairs.reserve(x.size());
        for (const T& e : x) {
            pairs.emplace_back(e, e);
        }
        return FinFunction<T>(x, x, pairs);
    }

    std::string name() const override { return "FinSet"; }
};

} // namespace cats
