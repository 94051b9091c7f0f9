#pragma once

#include "cats/category.hpp"
#include "cats/errors.hpp"
#include "cats/finset.hpp"

#include <boost/lexical_cast.hpp>
#include <memory>
#include <string>
#include <utility>

namespace cats {

// The identity arrow on `object`, the only kind of morphism in a discrete
// category.
template <typename T>
struct DiscreteArrow {
    T object;

    friend bool operator==(const DiscreteArrow& a, const DiscreteArrow& b) { return a.object == b.object; }
    friend bool operator!=(const DiscreteArrow& a, const DiscreteArrow& b) { return !(a == b); }
};

// The discrete category on a given finite set. Unlike the singleton
// categories it carries state, so two instances are equal exactly when
// their sets are.
template <typename T>
class DiscreteCategory : public Category<T, DiscreteArrow<T>> {
public:
    typedef Category<T, DiscreteArrow<T>> Base;

    explicit DiscreteCategory(FinSet<T> objects) : objects_(std::move(objects)) {}

    static std::shared_ptr<const DiscreteCategory> over(FinSet<T> objects) {
        return std::make_shared<DiscreteCategory>(std::move(objects));
    }

    // dom, codom and compose reject arrows on objects outside the set.
    T dom(const DiscreteArrow<T>& f) const override { return checked(f.object); }

    T codom(const DiscreteArrow<T>& f) const override { return checked(f.object); }

    DiscreteArrow<T> compose(const DiscreteArrow<T>& f, const DiscreteArrow<T>& g) const override {
        this->check_composable(f, g);
        return f;
    }

    DiscreteArrow<T> id(const T& x) const override {
        return DiscreteArrow<T>{checked(x)};
    }

    std::string name() const override {
        return "Discrete" + boost::lexical_cast<std::string>(objects_);
    }

    bool equals(const Base& other) const override {
        const DiscreteCategory* o = dynamic_cast<const DiscreteCategory*>(&other);
        return o && o->objects_ == objects_;
    }

    const FinSet<T>& objects() const { return objects_; }

private:
    const T& checked(const T& x) const {
        if (!objects_.contains(x)) {
            raise<invalid_morphism>(boost::lexical_cast<std::string>(x) + " is not an object of " + name());
        }
        return x;
    }

    FinSet<T> objects_;
};

} // namespace cats
