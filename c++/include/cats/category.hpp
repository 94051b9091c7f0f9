#pragma once

#include "cats/errors.hpp"

#include <string>
#include <typeinfo>

namespace cats {

// Equality on objects or morphisms of a category. Specialize for value types
// without a usable operator==.
template <typename T>
struct value_equal {
    bool operator()(const T& a, const T& b) const {
        return a == b;
    }
};

// A category over object type Ob and morphism type Hom.
//
// Only a subset of Ob and Hom need be objects and morphisms of a given
// category. Morphism f belongs to Hom(x, y) iff dom(f) == x and
// codom(f) == y; this is documented, not checked by the type system.
//
// compose(f, g) means "f, then g" and requires codom(f) == dom(g).
// Implementations must make compose associative and id a two-sided unit;
// see cats/laws.hpp for checks.
template <typename Ob, typename Hom>
class Category {
public:
    typedef Ob Obj;
    typedef Hom Mor;

    virtual ~Category() = default;

    virtual Ob dom(const Hom&) const {
        raise<not_implemented>("dom", name());
    }

    virtual Ob codom(const Hom&) const {
        raise<not_implemented>("codom", name());
    }

    virtual Hom compose(const Hom&, const Hom&) const {
        raise<not_implemented>("compose", name());
    }

    virtual Hom id(const Ob&) const {
        raise<not_implemented>("id", name());
    }

    virtual std::string name() const {
        return "Category";
    }

    // Equality of category values. Stateless categories are equal whenever
    // their dynamic types are; categories carrying state must override.
    virtual bool equals(const Category& other) const {
        return typeid(*this) == typeid(other);
    }

protected:
    void check_composable(const Hom& f, const Hom& g) const {
        if (!value_equal<Ob>()(codom(f), dom(g))) {
            raise<domain_mismatch>("compose in " + name() +
                                   ": codomain of the first morphism is not the domain of the second");
        }
    }
};

} // namespace cats
