#include "cats/fin.hpp"
#include "cats/errors.hpp"

#include <utility>

namespace cats {

FinMap::FinMap(std::size_t n, std::size_t m, std::vector<std::size_t> images)
    : n_(n), m_(m), images_(std::move(images)) {
    if (images_.size() != n_) {
        raise<invalid_morphism>("map out of " + std::to_string(n_) + " has " +
                                std::to_string(images_.size()) + " images");
    }
    for (std::size_t i = 0; i < n_; ++i) {
        if (images_[i] < 1 || images_[i] > m_) {
            raise<invalid_morphism>("image " + std::to_string(images_[i]) + " of " + std::to_string(i + 1) +
                                    " is outside 1.." + std::to_string(m_));
        }
    }
}

std::size_t FinMap::operator()(std::size_t i) const {
    if (i < 1 || i > n_) {
        raise<key_not_found>(std::to_string(i) + " is outside 1.." + std::to_string(n_));
    }
    return images_[i - 1];
}

std::shared_ptr<const FinCategory> FinCategory::instance() {
    static const std::shared_ptr<const FinCategory> fin = std::make_shared<FinCategory>();
    return fin;
}

std::size_t FinCategory::dom(const FinMap& f) const {
    return f.dom();
}

std::size_t FinCategory::codom(const FinMap& f) const {
    return f.codom();
}

FinMap FinCategory::compose(const FinMap& f, const FinMap& g) const {
    check_composable(f, g);
    std::vector<std::size_t> images(f.dom());
    for (std::size_t i = 1; i <= f.dom(); ++i) {
        images[i - 1] = g(f(i));
    }
    return FinMap(f.dom(), g.codom(), std::move(images));
}

FinMap FinCategory::id(const std::size_t& n) const {
    std::vector<std::size_t> images(n);
    for (std::size_t i = 0; i < n; ++i) {
        images[i] = i + 1;
    }
    return FinMap(n, n, std::move(images));
}

std::string FinCategory::name() const {
    return "Fin";
}

} // namespace cats
