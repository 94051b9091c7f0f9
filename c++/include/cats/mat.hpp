#pragma once

#include "cats/category.hpp"

#include <boost/numeric/ublas/matrix.hpp>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>

namespace cats {

typedef boost::numeric::ublas::matrix<double> Mat;

// Builds a matrix from its rows; all rows must have the same length.
Mat make_matrix(std::initializer_list<std::initializer_list<double>> rows);

// Same shape and exactly equal entries.
bool matrix_equal(const Mat& a, const Mat& b);

template <>
struct value_equal<Mat> {
    bool operator()(const Mat& a, const Mat& b) const {
        return matrix_equal(a, b);
    }
};

// Objects are natural numbers; a morphism n -> m is an n x m matrix.
// compose(A, B) is the product A * B and id(n) the n x n identity.
class MatCategory : public Category<std::size_t, Mat> {
public:
    static std::shared_ptr<const MatCategory> instance();

    std::size_t dom(const Mat& a) const override;
    std::size_t codom(const Mat& a) const override;
    Mat compose(const Mat& a, const Mat& b) const override;
    Mat id(const std::size_t& n) const override;
    std::string name() const override;
};

} // namespace cats
