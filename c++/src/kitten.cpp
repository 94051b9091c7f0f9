#include "cats/kitten.hpp"
#include "cats/functor.hpp"
#include "cats/log.hpp"

namespace cats {

std::shared_ptr<const KittenCategory> KittenCategory::instance() {
    static const std::shared_ptr<const KittenCategory> kitten = std::make_shared<KittenCategory>();
    return kitten;
}

AnyCategory KittenCategory::dom(const AnyFunctor& f) const {
    return f.dom();
}

AnyCategory KittenCategory::codom(const AnyFunctor& f) const {
    return f.codom();
}

AnyFunctor KittenCategory::compose(const AnyFunctor& f, const AnyFunctor& g) const {
    if (f.codom() != g.dom()) {
        raise<composition_mismatch>("compose in " + name() + ": " + f.name() + " ends in " +
                                    f.codom().name() + " but " + g.name() + " starts in " +
                                    g.dom().name());
    }
    CATS_LOG(trace) << "kitten compose " << f.name() << " ; " << g.name();
    return AnyFunctor(compose_functors(f.get(), g.get()));
}

AnyFunctor KittenCategory::id(const AnyCategory& c) const {
    return AnyFunctor(identity_functor(c.get()));
}

std::string KittenCategory::name() const {
    return "Kitten";
}

} // namespace cats
