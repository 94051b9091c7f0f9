#include "cats/mat.hpp"
#include "cats/errors.hpp"

#include <string>

namespace ublas = boost::numeric::ublas;

namespace cats {

Mat make_matrix(std::initializer_list<std::initializer_list<double>> rows) {
    const std::size_t cols = rows.size() == 0 ? 0 : rows.begin()->size();
    Mat m(rows.size(), cols);
    std::size_t i = 0;
    for (const auto& row : rows) {
        if (row.size() != cols) {
            raise<invalid_morphism>("row " + std::to_string(i + 1) + " has " + std::to_string(row.size()) +
                                    " entries, expected " + std::to_string(cols));
        }
        std::size_t j = 0;
        for (double v : row) {
            m(i, j++) = v;
        }
        ++i;
    }
    return m;
}

bool matrix_equal(const Mat& a, const Mat& b) {
    if (a.size1() != b.size1() || a.size2() != b.size2()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size1(); ++i) {
        for (std::size_t j = 0; j < a.size2(); ++j) {
            if (a(i, j) != b(i, j)) {
                return false;
            }
        }
    }
    return true;
}

std::shared_ptr<const MatCategory> MatCategory::instance() {
    static const std::shared_ptr<const MatCategory> mat = std::make_shared<MatCategory>();
    return mat;
}

std::size_t MatCategory::dom(const Mat& a) const {
    return a.size1();
}

std::size_t MatCategory::codom(const Mat& a) const {
    return a.size2();
}

Mat MatCategory::compose(const Mat& a, const Mat& b) const {
    check_composable(a, b);
    return ublas::prod(a, b);
}

Mat MatCategory::id(const std::size_t& n) const {
    return ublas::identity_matrix<double>(n);
}

std::string MatCategory::name() const {
    return "Mat";
}

} // namespace cats
