#pragma once

#include "cats/category.hpp"
#include "cats/errors.hpp"
#include "cats/log.hpp"

#include <boost/function.hpp>
#include <memory>
#include <string>
#include <utility>

namespace cats {

// A functor from a category of type Source to one of type Target.
//
// The functor is parameterized by the category types but holds the category
// values, because some categories carry state beyond their type.
// hom_map must preserve identities and composition:
//   hom_map(id(x)) == id(ob_map(x))
//   hom_map(compose(f, g)) == compose(hom_map(f), hom_map(g))
// These are laws of the implementation, not checked at runtime.
template <typename Source, typename Target>
class Functor {
public:
    typedef Source SourceCategory;
    typedef Target TargetCategory;
    typedef typename Source::Obj SourceOb;
    typedef typename Source::Mor SourceHom;
    typedef typename Target::Obj TargetOb;
    typedef typename Target::Mor TargetHom;

    Functor(std::shared_ptr<const Source> source, std::shared_ptr<const Target> target)
        : source_(std::move(source)), target_(std::move(target)) {
        if (!source_ || !target_) {
            raise<null_argument>("functor needs a source and a target category");
        }
    }

    virtual ~Functor() = default;

    virtual TargetOb ob_map(const SourceOb&) const {
        raise<not_implemented>("ob_map", name());
    }

    virtual TargetHom hom_map(const SourceHom&) const {
        raise<not_implemented>("hom_map", name());
    }

    virtual std::string name() const {
        return source_->name() + " -> " + target_->name();
    }

    const Source& source() const { return *source_; }
    const Target& target() const { return *target_; }

    const std::shared_ptr<const Source>& source_ptr() const { return source_; }
    const std::shared_ptr<const Target>& target_ptr() const { return target_; }

private:
    std::shared_ptr<const Source> source_;
    std::shared_ptr<const Target> target_;
};

template <typename Source, typename Target>
class FunctionFunctor : public Functor<Source, Target> {
public:
    typedef Functor<Source, Target> Base;
    typedef boost::function<typename Base::TargetOb(const typename Base::SourceOb&)> ObFunction;
    typedef boost::function<typename Base::TargetHom(const typename Base::SourceHom&)> HomFunction;

    FunctionFunctor(std::shared_ptr<const Source> source, std::shared_ptr<const Target> target,
                    ObFunction ob, HomFunction hom, std::string label = "")
        : Base(std::move(source), std::move(target)),
          ob_(std::move(ob)), hom_(std::move(hom)), label_(std::move(label)) {}

    typename Base::TargetOb ob_map(const typename Base::SourceOb& x) const override {
        if (ob_.empty()) {
            return Base::ob_map(x);
        }
        return ob_(x);
    }

    typename Base::TargetHom hom_map(const typename Base::SourceHom& f) const override {
        if (hom_.empty()) {
            return Base::hom_map(f);
        }
        return hom_(f);
    }

    std::string name() const override {
        return label_.empty() ? Base::name() : label_;
    }

private:
    ObFunction ob_;
    HomFunction hom_;
    std::string label_;
};

template <typename Source, typename Target, typename ObFn, typename HomFn>
std::shared_ptr<const Functor<Source, Target>> make_functor(
    std::shared_ptr<const Source> source, std::shared_ptr<const Target> target,
    ObFn ob, HomFn hom, std::string label = "") {
    return std::make_shared<FunctionFunctor<Source, Target>>(
        std::move(source), std::move(target), std::move(ob), std::move(hom), std::move(label));
}

// First F, then G. Holds both by shared pointer and applies them on every
// call; nothing is tabulated.
template <typename Source, typename Middle, typename Target>
class ComposedFunctor : public Functor<Source, Target> {
public:
    typedef Functor<Source, Target> Base;
    typedef Functor<Source, Middle> First;
    typedef Functor<Middle, Target> Second;

    ComposedFunctor(std::shared_ptr<const First> f, std::shared_ptr<const Second> g)
        : Base(checked(f)->source_ptr(), checked(g)->target_ptr()),
          f_(std::move(f)), g_(std::move(g)) {
        if (!f_->target().equals(g_->source())) {
            raise<composition_mismatch>("cannot compose " + f_->name() + " with " + g_->name() +
                                        ": " + f_->target().name() + " is not " + g_->source().name());
        }
        CATS_LOG(trace) << "composed functor " << name();
    }

    typename Base::TargetOb ob_map(const typename Base::SourceOb& x) const override {
        return g_->ob_map(f_->ob_map(x));
    }

    typename Base::TargetHom hom_map(const typename Base::SourceHom& f) const override {
        return g_->hom_map(f_->hom_map(f));
    }

    std::string name() const override {
        return "(" + f_->name() + ") ; (" + g_->name() + ")";
    }

    const std::shared_ptr<const First>& first() const { return f_; }
    const std::shared_ptr<const Second>& second() const { return g_; }

private:
    template <typename P>
    static const P& checked(const P& p) {
        if (!p) {
            raise<null_argument>("cannot compose a null functor");
        }
        return p;
    }

    std::shared_ptr<const First> f_;
    std::shared_ptr<const Second> g_;
};

template <typename C>
class IdentityFunctor : public Functor<C, C> {
public:
    typedef Functor<C, C> Base;

    explicit IdentityFunctor(const std::shared_ptr<const C>& category)
        : Base(category, category) {
        CATS_LOG(trace) << "identity functor on " << category->name();
    }

    typename Base::TargetOb ob_map(const typename Base::SourceOb& x) const override {
        return x;
    }

    typename Base::TargetHom hom_map(const typename Base::SourceHom& f) const override {
        return f;
    }

    std::string name() const override {
        return "Id(" + this->source().name() + ")";
    }
};

template <typename Source, typename Middle, typename Target>
std::shared_ptr<const Functor<Source, Target>> compose_functors(
    std::shared_ptr<const Functor<Source, Middle>> f,
    std::shared_ptr<const Functor<Middle, Target>> g) {
    return std::make_shared<ComposedFunctor<Source, Middle, Target>>(std::move(f), std::move(g));
}

template <typename C>
std::shared_ptr<const Functor<C, C>> identity_functor(const std::shared_ptr<const C>& category) {
    return std::make_shared<IdentityFunctor<C>>(category);
}

} // namespace cats
