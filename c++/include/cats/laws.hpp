#pragma once

#include "cats/category.hpp"
#include "cats/erased.hpp"
#include "cats/functor.hpp"

#include <boost/any.hpp>

namespace cats {

template <typename C>
bool morphisms_equal(const C&, const typename C::Mor& a, const typename C::Mor& b) {
    return value_equal<typename C::Mor>()(a, b);
}

inline bool morphisms_equal(const ErasedCategory& c, const boost::any& a, const boost::any& b) {
    return c.same_morphism(a, b);
}

// compose(id(dom f), f) == f and compose(f, id(codom f)) == f.
template <typename C>
bool satisfies_identity_laws(const C& c, const typename C::Mor& f) {
    return morphisms_equal(c, c.compose(c.id(c.dom(f)), f), f) &&
           morphisms_equal(c, c.compose(f, c.id(c.codom(f))), f);
}

template <typename C>
bool is_associative(const C& c, const typename C::Mor& f, const typename C::Mor& g,
                    const typename C::Mor& h) {
    return morphisms_equal(c, c.compose(c.compose(f, g), h), c.compose(f, c.compose(g, h)));
}

// hom_map(id(x)) == id(ob_map(x))
template <typename Source, typename Target>
bool preserves_identity(const Functor<Source, Target>& F, const typename Source::Obj& x) {
    return morphisms_equal(F.target(), F.hom_map(F.source().id(x)), F.target().id(F.ob_map(x)));
}

// hom_map(compose(r, s)) == compose(hom_map(r), hom_map(s)) for composable r, s.
template <typename Source, typename Target>
bool preserves_composition(const Functor<Source, Target>& F, const typename Source::Mor& r,
                           const typename Source::Mor& s) {
    return morphisms_equal(F.target(), F.hom_map(F.source().compose(r, s)),
                           F.target().compose(F.hom_map(r), F.hom_map(s)));
}

} // namespace cats
