#include "cats/functors/fin_to_mat.hpp"

namespace ublas = boost::numeric::ublas;

namespace cats {

FinToMat::FinToMat() : Functor<FinCategory, MatCategory>(FinCategory::instance(), MatCategory::instance()) {}

std::shared_ptr<const FinToMat> FinToMat::instance() {
    static const std::shared_ptr<const FinToMat> functor = std::make_shared<FinToMat>();
    return functor;
}

std::size_t FinToMat::ob_map(const std::size_t& n) const {
    return n;
}

Mat FinToMat::hom_map(const FinMap& f) const {
    Mat a = ublas::zero_matrix<double>(f.dom(), f.codom());
    for (std::size_t i = 1; i <= f.dom(); ++i) {
        a(i - 1, f(i) - 1) = 1.0;
    }
    return a;
}

std::string FinToMat::name() const {
    return "FinToMat";
}

} // namespace cats
