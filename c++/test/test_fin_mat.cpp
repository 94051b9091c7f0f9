#include <gtest/gtest.h>
#include "cats/fin.hpp"
#include "cats/functors/fin_to_mat.hpp"
#include "cats/laws.hpp"
#include "cats/mat.hpp"

using namespace cats;

namespace {

const FinCategory& fin() {
    return *FinCategory::instance();
}

const MatCategory& mat() {
    return *MatCategory::instance();
}

} // namespace

// ─── Fin ───────────────────────────────────────────────────────

TEST(FinTest, MapIsOneBased) {
    FinMap f(2, 3, {2, 3});
    EXPECT_EQ(f(1), 2u);
    EXPECT_EQ(f(2), 3u);
    EXPECT_THROW(f(0), key_not_found);
    EXPECT_THROW(f(3), key_not_found);
}

TEST(FinTest, RejectsMalformedMaps) {
    EXPECT_THROW(FinMap(2, 3, {1}), invalid_morphism);
    EXPECT_THROW(FinMap(2, 3, {1, 4}), invalid_morphism);
    EXPECT_THROW(FinMap(2, 3, {0, 1}), invalid_morphism);
}

TEST(FinTest, ComposeAndId) {
    FinMap f(2, 3, {2, 3});
    FinMap g(3, 2, {1, 1, 2});
    FinMap h = fin().compose(f, g);
    EXPECT_EQ(h, FinMap(2, 2, {1, 2}));
    EXPECT_EQ(fin().id(3), FinMap(3, 3, {1, 2, 3}));
    EXPECT_EQ(fin().id(0), FinMap(0, 0, {}));
}

TEST(FinTest, MismatchIsRejected) {
    FinMap f(2, 3, {2, 3});
    EXPECT_THROW(fin().compose(f, f), domain_mismatch);
}

TEST(FinTest, Laws) {
    FinMap f(2, 3, {2, 3});
    FinMap g(3, 2, {1, 1, 2});
    FinMap h(2, 2, {2, 1});
    EXPECT_TRUE(satisfies_identity_laws(fin(), f));
    EXPECT_TRUE(satisfies_identity_laws(fin(), g));
    EXPECT_TRUE(is_associative(fin(), f, g, h));
}

// ─── Mat ───────────────────────────────────────────────────────

TEST(MatTest, MakeMatrix) {
    Mat m = make_matrix({{1, 2, 3}, {4, 5, 6}});
    EXPECT_EQ(m.size1(), 2u);
    EXPECT_EQ(m.size2(), 3u);
    EXPECT_EQ(m(1, 2), 6.0);
    EXPECT_THROW(make_matrix({{1, 2}, {3}}), invalid_morphism);
}

TEST(MatTest, EqualityNeedsSameShape) {
    EXPECT_TRUE(matrix_equal(make_matrix({{1, 0}}), make_matrix({{1, 0}})));
    EXPECT_FALSE(matrix_equal(make_matrix({{1, 0}}), make_matrix({{1}, {0}})));
    EXPECT_FALSE(matrix_equal(make_matrix({{1, 0}}), make_matrix({{1, 1}})));
}

TEST(MatTest, ComposeIsProduct) {
    Mat a = make_matrix({{1, 2, 0}, {0, 1, 1}});
    Mat b = make_matrix({{1, 0}, {0, 1}, {2, 3}});
    EXPECT_EQ(mat().dom(a), 2u);
    EXPECT_EQ(mat().codom(a), 3u);
    EXPECT_TRUE(matrix_equal(mat().compose(a, b), make_matrix({{1, 2}, {2, 4}})));
}

TEST(MatTest, Identity) {
    EXPECT_TRUE(matrix_equal(mat().id(2), make_matrix({{1, 0}, {0, 1}})));
    EXPECT_EQ(mat().id(0).size1(), 0u);
}

TEST(MatTest, MismatchIsRejected) {
    Mat a = make_matrix({{1, 2, 0}, {0, 1, 1}});
    EXPECT_THROW(mat().compose(a, a), domain_mismatch);
}

TEST(MatTest, Laws) {
    Mat a = make_matrix({{1, 2, 0}, {0, 1, 1}});
    Mat b = make_matrix({{1, 0}, {0, 1}, {2, 3}});
    Mat c = make_matrix({{0, 1}, {1, 1}});
    EXPECT_TRUE(satisfies_identity_laws(mat(), a));
    EXPECT_TRUE(is_associative(mat(), a, b, c));
}

// ─── Fin -> Mat ────────────────────────────────────────────────

TEST(FinToMatTest, IndicatorMatrix) {
    const FinToMat& F = *FinToMat::instance();
    FinMap f(2, 3, {2, 3});
    EXPECT_EQ(F.ob_map(2), 2u);
    EXPECT_TRUE(matrix_equal(F.hom_map(f), make_matrix({{0, 1, 0}, {0, 0, 1}})));
}

TEST(FinToMatTest, IdentityGoesToIdentityMatrix) {
    const FinToMat& F = *FinToMat::instance();
    EXPECT_TRUE(matrix_equal(F.hom_map(fin().id(2)), make_matrix({{1, 0}, {0, 1}})));
}

TEST(FinToMatTest, EmptyDomain) {
    const FinToMat& F = *FinToMat::instance();
    Mat m = F.hom_map(FinMap(0, 3, {}));
    EXPECT_EQ(m.size1(), 0u);
    EXPECT_EQ(m.size2(), 3u);
}

TEST(FinToMatTest, PreservesIdentities) {
    const FinToMat& F = *FinToMat::instance();
    for (std::size_t n = 0; n < 5; ++n) {
        EXPECT_TRUE(preserves_identity(F, n)) << "n = " << n;
    }
}

TEST(FinToMatTest, PreservesComposition) {
    const FinToMat& F = *FinToMat::instance();
    FinMap f(2, 3, {2, 3});
    FinMap g(3, 2, {1, 1, 2});
    FinMap h(2, 4, {4, 4});
    EXPECT_TRUE(preserves_composition(F, f, g));
    EXPECT_TRUE(preserves_composition(F, g, h));
    EXPECT_TRUE(preserves_composition(F, fin().compose(f, g), h));
}

TEST(FinToMatTest, SourceAndTarget) {
    const FinToMat& F = *FinToMat::instance();
    EXPECT_EQ(F.source().name(), "Fin");
    EXPECT_EQ(F.target().name(), "Mat");
}
