#pragma once

#include "cats/category.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cats {

// A total function {1..n} -> {1..m}, stored as its n images.
class FinMap {
public:
    FinMap(std::size_t n, std::size_t m, std::vector<std::size_t> images);

    std::size_t dom() const { return n_; }
    std::size_t codom() const { return m_; }
    const std::vector<std::size_t>& images() const { return images_; }

    // One-based, like the sets it maps between.
    std::size_t operator()(std::size_t i) const;

    friend bool operator==(const FinMap& a, const FinMap& b) {
        return a.n_ == b.n_ && a.m_ == b.m_ && a.images_ == b.images_;
    }

    friend bool operator!=(const FinMap& a, const FinMap& b) { return !(a == b); }

private:
    std::size_t n_;
    std::size_t m_;
    std::vector<std::size_t> images_;
};

// Objects are natural numbers n standing for {1..n}; morphisms are FinMaps.
class FinCategory : public Category<std::size_t, FinMap> {
public:
    static std::shared_ptr<const FinCategory> instance();

    std::size_t dom(const FinMap& f) const override;
    std::size_t codom(const FinMap& f) const override;
    FinMap compose(const FinMap& f, const FinMap& g) const override;
    FinMap id(const std::size_t& n) const override;
    std::string name() const override;
};

} // namespace cats
