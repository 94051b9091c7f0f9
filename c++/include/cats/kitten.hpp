#pragma once

#include "cats/category.hpp"
#include "cats/erased.hpp"

#include <memory>
#include <string>

namespace cats {

// The category whose objects are categories and whose morphisms are functors.
//
// Objects and morphisms are type-erased handles, so categories and functors
// of unrelated C++ types live side by side. This is the category of the
// categories expressible here, not of all small categories.
class KittenCategory : public Category<AnyCategory, AnyFunctor> {
public:
    static std::shared_ptr<const KittenCategory> instance();

    AnyCategory dom(const AnyFunctor& f) const override;
    AnyCategory codom(const AnyFunctor& f) const override;

    // First f, then g. Fails with composition_mismatch unless
    // codom(f) == dom(g).
    AnyFunctor compose(const AnyFunctor& f, const AnyFunctor& g) const override;

    AnyFunctor id(const AnyCategory& c) const override;

    std::string name() const override;
};

} // namespace cats
