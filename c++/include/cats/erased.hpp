#pragma once

#include "cats/category.hpp"
#include "cats/errors.hpp"
#include "cats/functor.hpp"

#include <boost/any.hpp>
#include <boost/core/demangle.hpp>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace cats {

// A category whose objects and morphisms are boxed in boost::any. Lets
// categories of unrelated types be handled uniformly, e.g. as objects of
// KittenCategory.
class ErasedCategory : public Category<boost::any, boost::any> {
public:
    virtual bool same_object(const boost::any& a, const boost::any& b) const = 0;
    virtual bool same_morphism(const boost::any& a, const boost::any& b) const = 0;
};

typedef Functor<ErasedCategory, ErasedCategory> ErasedFunctor;

template <typename T>
const T& unbox(const boost::any& value, const std::string& where) {
    const T* p = boost::any_cast<T>(&value);
    if (!p) {
        raise<type_mismatch>(where + ": expected " + boost::core::demangle(typeid(T).name()) +
                             ", got " + boost::core::demangle(value.type().name()));
    }
    return *p;
}

template <typename Ob, typename Hom>
class ErasedCategoryModel : public ErasedCategory {
public:
    explicit ErasedCategoryModel(std::shared_ptr<const Category<Ob, Hom>> category)
        : category_(std::move(category)) {}

    boost::any dom(const boost::any& f) const override {
        return category_->dom(unbox<Hom>(f, name()));
    }

    boost::any codom(const boost::any& f) const override {
        return category_->codom(unbox<Hom>(f, name()));
    }

    boost::any compose(const boost::any& f, const boost::any& g) const override {
        return category_->compose(unbox<Hom>(f, name()), unbox<Hom>(g, name()));
    }

    boost::any id(const boost::any& x) const override {
        return category_->id(unbox<Ob>(x, name()));
    }

    std::string name() const override {
        return category_->name();
    }

    bool equals(const Category<boost::any, boost::any>& other) const override {
        const ErasedCategoryModel* o = dynamic_cast<const ErasedCategoryModel*>(&other);
        return o && (o->category_ == category_ || category_->equals(*o->category_));
    }

    bool same_object(const boost::any& a, const boost::any& b) const override {
        return value_equal<Ob>()(unbox<Ob>(a, name()), unbox<Ob>(b, name()));
    }

    bool same_morphism(const boost::any& a, const boost::any& b) const override {
        return value_equal<Hom>()(unbox<Hom>(a, name()), unbox<Hom>(b, name()));
    }

    const std::shared_ptr<const Category<Ob, Hom>>& category() const { return category_; }

private:
    std::shared_ptr<const Category<Ob, Hom>> category_;
};

template <typename C>
std::shared_ptr<const ErasedCategory> erase_category(std::shared_ptr<C> category) {
    typedef typename std::remove_const<C>::type Plain;
    if (!category) {
        raise<null_argument>("cannot erase a null category");
    }
    if constexpr (std::is_base_of<ErasedCategory, Plain>::value) {
        return category;
    } else {
        typedef Category<typename Plain::Obj, typename Plain::Mor> Interface;
        return std::make_shared<ErasedCategoryModel<typename Plain::Obj, typename Plain::Mor>>(
            std::shared_ptr<const Interface>(std::move(category)));
    }
}

template <typename Source, typename Target>
class ErasedFunctorModel : public ErasedFunctor {
public:
    typedef Functor<Source, Target> Wrapped;

    explicit ErasedFunctorModel(std::shared_ptr<const Wrapped> functor)
        : ErasedFunctor(erase_category(functor->source_ptr()), erase_category(functor->target_ptr())),
          functor_(std::move(functor)) {}

    boost::any ob_map(const boost::any& x) const override {
        return functor_->ob_map(unbox<typename Wrapped::SourceOb>(x, name()));
    }

    boost::any hom_map(const boost::any& f) const override {
        return functor_->hom_map(unbox<typename Wrapped::SourceHom>(f, name()));
    }

    std::string name() const override {
        return functor_->name();
    }

private:
    std::shared_ptr<const Wrapped> functor_;
};

template <typename F>
std::shared_ptr<const ErasedFunctor> erase_functor(std::shared_ptr<F> functor) {
    typedef typename std::remove_const<F>::type Plain;
    typedef typename Plain::SourceCategory Source;
    typedef typename Plain::TargetCategory Target;
    if (!functor) {
        raise<null_argument>("cannot erase a null functor");
    }
    if constexpr (std::is_same<Source, ErasedCategory>::value &&
                  std::is_same<Target, ErasedCategory>::value) {
        return functor;
    } else {
        return std::make_shared<ErasedFunctorModel<Source, Target>>(
            std::shared_ptr<const Functor<Source, Target>>(std::move(functor)));
    }
}

// Value handle on a shared category. Two handles are equal when they share
// the category or when the categories are equal as values (Category::equals).
class AnyCategory {
public:
    template <typename C>
    AnyCategory(std::shared_ptr<C> category) : erased_(erase_category(std::move(category))) {}

    const ErasedCategory& operator*() const { return *erased_; }
    const ErasedCategory* operator->() const { return erased_.get(); }
    const std::shared_ptr<const ErasedCategory>& get() const { return erased_; }

    std::string name() const { return erased_->name(); }

    friend bool operator==(const AnyCategory& a, const AnyCategory& b) {
        return a.erased_ == b.erased_ || a.erased_->equals(*b.erased_);
    }

    friend bool operator!=(const AnyCategory& a, const AnyCategory& b) {
        return !(a == b);
    }

private:
    std::shared_ptr<const ErasedCategory> erased_;
};

// Value handle on a shared functor between erased categories. Equality is
// identity of the functor object; extensional equality of functors is not
// decidable in general.
class AnyFunctor {
public:
    template <typename F>
    AnyFunctor(std::shared_ptr<F> functor) : erased_(erase_functor(std::move(functor))) {}

    AnyCategory dom() const { return AnyCategory(erased_->source_ptr()); }
    AnyCategory codom() const { return AnyCategory(erased_->target_ptr()); }

    boost::any ob_map(const boost::any& x) const { return erased_->ob_map(x); }
    boost::any hom_map(const boost::any& f) const { return erased_->hom_map(f); }

    std::string name() const { return erased_->name(); }

    const ErasedFunctor& operator*() const { return *erased_; }
    const std::shared_ptr<const ErasedFunctor>& get() const { return erased_; }

    friend bool operator==(const AnyFunctor& a, const AnyFunctor& b) {
        return a.erased_ == b.erased_;
    }

    friend bool operator!=(const AnyFunctor& a, const AnyFunctor& b) {
        return !(a == b);
    }

private:
    std::shared_ptr<const ErasedFunctor> erased_;
};

} // namespace cats
