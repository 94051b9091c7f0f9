#pragma once

#include "cats/fin.hpp"
#include "cats/functor.hpp"
#include "cats/mat.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace cats {

// Sends {1..n} to n and a function f to its indicator matrix, the n x m
// matrix A with A[i][f(i)] = 1 and zeros elsewhere.
class FinToMat : public Functor<FinCategory, MatCategory> {
public:
    FinToMat();

    static std::shared_ptr<const FinToMat> instance();

    std::size_t ob_map(const std::size_t& n) const override;
    Mat hom_map(const FinMap& f) const override;
    std::string name() const override;
};

} // namespace cats
