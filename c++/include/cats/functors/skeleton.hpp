#pragma once

#include "cats/errors.hpp"
#include "cats/fin.hpp"
#include "cats/finset.hpp"
#include "cats/functor.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cats {

// Replaces a finite set by its size. Elements are numbered 1..n in
// iteration order, which equal sets share, so identities and composites
// are preserved.
template <typename T>
class Skeleton : public Functor<FinSetCategory<T>, FinCategory> {
public:
    Skeleton() : Functor<FinSetCategory<T>, FinCategory>(FinSetCategory<T>::instance(), FinCategory::instance()) {}

    static std::shared_ptr<const Skeleton> instance() {
        static const std::shared_ptr<const Skeleton> functor = std::make_shared<Skeleton>();
        return functor;
    }

    std::size_t ob_map(const FinSet<T>& x) const override {
        return x.size();
    }

    FinMap hom_map(const FinFunction<T>& f) const override {
        std::vector<std::size_t> images;
        images.reserve(f.dom().size());
        for (const T& x : f.dom()) {
            const T y = f(x);
            boost::optional<std::size_t> j = f.codom().index_of(y);
            if (!j) {
                raise<key_not_found>(boost::lexical_cast<std::string>(y) + " is not in the codomain");
            }
            images.push_back(*j + 1);
        }
        return FinMap(f.dom().size(), f.codom().size(), std::move(images));
    }

    std::string name() const override {
        return "Skeleton";
    }
};

} // namespace cats
