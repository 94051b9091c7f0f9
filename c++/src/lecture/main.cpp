#include "cats/fin.hpp"
#include "cats/finset.hpp"
#include "cats/functors/fin_to_mat.hpp"
#include "cats/functors/skeleton.hpp"
#include "cats/kitten.hpp"
#include "cats/laws.hpp"
#include "cats/log.hpp"
#include "cats/mat.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/numeric/ublas/io.hpp>
#include <boost/program_options.hpp>
#include <cstddef>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

struct Options {
    std::string log_level = "warning";
    std::string image = "2,3";
    std::size_t codomain = 3;
};

std::vector<std::size_t> parse_image(const std::string& text) {
    std::vector<std::string> parts;
    boost::split(parts, text, boost::is_any_of(","), boost::token_compress_on);
    std::vector<std::size_t> images;
    for (const auto& part : parts) {
        if (!part.empty()) {
            images.push_back(boost::lexical_cast<std::size_t>(part));
        }
    }
    return images;
}

void finset_block() {
    typedef cats::FinSetCategory<int> FinSetInt;
    const auto& category = *FinSetInt::instance();

    cats::FinSet<int> a{1, 2}, b{3, 4}, c{5, 6};
    cats::FinFunction<int> f(a, b, {{1, 3}, {2, 4}});
    cats::FinFunction<int> g(b, c, {{3, 5}, {4, 6}});

    cats::FinFunction<int> gf = category.compose(f, g);
    std::cout << "FinSet: f ; g on " << gf.dom() << ":";
    for (int x : gf.dom()) {
        std::cout << " " << x << "->" << gf(x);
    }
    std::cout << "\n";

    cats::FinFunction<int> ida = category.id(a);
    std::cout << "FinSet: id" << a << ":";
    for (int x : a) {
        std::cout << " " << x << "->" << ida(x);
    }
    std::cout << "\n";
}

void fin_to_mat_block(const Options& options) {
    const cats::FinToMat& functor = *cats::FinToMat::instance();
    std::vector<std::size_t> images = parse_image(options.image);
    cats::FinMap f(images.size(), options.codomain, images);

    std::cout << "FinToMat: f = " << options.image << " -> " << functor.hom_map(f) << "\n";
    std::cout << "FinToMat: id_" << f.dom() << " -> " << functor.hom_map(functor.source().id(f.dom())) << "\n";
    std::cout << "FinToMat: preserves identity on " << f.dom() << ": " << std::boolalpha
              << cats::preserves_identity(functor, f.dom()) << "\n";
}

void kitten_block() {
    const cats::KittenCategory& kitten = *cats::KittenCategory::instance();
    cats::AnyFunctor skeleton(cats::Skeleton<int>::instance());
    cats::AnyFunctor to_mat(cats::FinToMat::instance());

    cats::AnyFunctor composed = kitten.compose(skeleton, to_mat);
    std::cout << "Kitten: " << composed.name() << " : " << kitten.dom(composed).name() << " -> "
              << kitten.codom(composed).name() << "\n";

    cats::FinSet<int> a{1, 2}, b{3, 4, 5};
    cats::FinFunction<int> f(a, b, {{1, 4}, {2, 5}});
    cats::Mat m = boost::any_cast<cats::Mat>(composed.hom_map(boost::any(f)));
    std::cout << "Kitten: f : " << a << " -> " << b << " maps to " << m << "\n";
}

} // namespace

int main(int argc, char** argv) {
    Options options;

    po::options_description desc("cats_lecture: evaluates the lecture examples in order");
    desc.add_options()
        ("help,h", "show this help")
        ("log-level", po::value<std::string>(&options.log_level)->default_value(options.log_level),
         "trace, debug, info, warning, error or fatal")
        ("image", po::value<std::string>(&options.image)->default_value(options.image),
         "comma separated one-based images of the Fin map sent through FinToMat")
        ("codomain", po::value<std::size_t>(&options.codomain)->default_value(options.codomain),
         "size m of the Fin map's codomain");

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << "\n";
            return 0;
        }
        po::notify(vm);

        cats::log::init(cats::log::parse_severity(options.log_level));

        finset_block();
        fin_to_mat_block(options);
        kitten_block();
    } catch (const po::error& e) {
        std::cerr << "cats_lecture: " << e.what() << "\n" << desc << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "cats_lecture: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
