#include <gtest/gtest.h>
#include "cats/category.hpp"
#include "cats/discrete.hpp"
#include "cats/fin.hpp"
#include "cats/finset.hpp"
#include "cats/functor.hpp"
#include "cats/laws.hpp"
#include "cats/log.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace cats;

namespace {

// Collects every record that passes the core filter while in scope.
class CapturedLog {
public:
    typedef boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend> Sink;

    CapturedLog() : sink_(boost::make_shared<Sink>()) {
        sink_->locked_backend()->add_stream(boost::shared_ptr<std::ostream>(&out_, boost::null_deleter()));
        sink_->locked_backend()->auto_flush(true);
        boost::log::core::get()->add_sink(sink_);
    }

    ~CapturedLog() {
        boost::log::core::get()->remove_sink(sink_);
    }

    std::string text() const { return out_.str(); }

private:
    std::ostringstream out_;
    boost::shared_ptr<Sink> sink_;
};

} // namespace

// ─── Base interface ────────────────────────────────────────────

TEST(CategoryTest, BareCategoryIsNotImplemented) {
    Category<int, int> bare;
    EXPECT_THROW(bare.dom(1), not_implemented);
    EXPECT_THROW(bare.codom(1), not_implemented);
    EXPECT_THROW(bare.compose(1, 2), not_implemented);
    EXPECT_THROW(bare.id(1), not_implemented);
}

TEST(CategoryTest, NotImplementedNamesTheOperation) {
    Category<int, int> bare;
    try {
        bare.compose(1, 2);
        FAIL() << "expected not_implemented";
    } catch (const not_implemented& e) {
        EXPECT_NE(std::string(e.what()).find("compose"), std::string::npos);
    }
}

TEST(CategoryTest, ErrorsShareABase) {
    FinMap f(2, 3, {2, 3});
    EXPECT_THROW(FinCategory::instance()->compose(f, f), category_error);
    EXPECT_THROW(FinCategory::instance()->compose(f, f), std::runtime_error);
}

TEST(CategoryTest, SingletonEqualityIsByType) {
    FinCategory a, b;
    EXPECT_TRUE(a.equals(b));
    EXPECT_TRUE(FinCategory::instance()->equals(*FinCategory::instance()));
}

// ─── Discrete ──────────────────────────────────────────────────

TEST(DiscreteTest, OnlyIdentities) {
    auto d = DiscreteCategory<int>::over({1, 2, 3});
    DiscreteArrow<int> one = d->id(1);
    EXPECT_EQ(d->dom(one), 1);
    EXPECT_EQ(d->codom(one), 1);
    EXPECT_EQ(d->compose(one, one), one);
    EXPECT_THROW(d->id(4), invalid_morphism);
}

TEST(DiscreteTest, MismatchIsRejected) {
    auto d = DiscreteCategory<int>::over({1, 2});
    EXPECT_THROW(d->compose(d->id(1), d->id(2)), domain_mismatch);
}

TEST(DiscreteTest, ArrowsOutsideTheSetAreRejected) {
    auto d = DiscreteCategory<int>::over({1, 2});
    DiscreteArrow<int> stray{99};
    EXPECT_THROW(d->compose(stray, stray), invalid_morphism);
    EXPECT_THROW(d->dom(stray), invalid_morphism);
    EXPECT_THROW(d->codom(stray), invalid_morphism);
}

TEST(DiscreteTest, Laws) {
    auto d = DiscreteCategory<int>::over({1, 2});
    DiscreteArrow<int> two = d->id(2);
    EXPECT_TRUE(satisfies_identity_laws(*d, two));
    EXPECT_TRUE(is_associative(*d, two, two, two));
}

TEST(DiscreteTest, EqualityIsStructural) {
    auto a = DiscreteCategory<int>::over({1, 2});
    auto b = DiscreteCategory<int>::over({2, 1});
    auto c = DiscreteCategory<int>::over({1});
    EXPECT_TRUE(a->equals(*b));
    EXPECT_FALSE(a->equals(*c));
    EXPECT_EQ(a->name(), "Discrete{1, 2}");
}

// ─── Logging ───────────────────────────────────────────────────

TEST(LogTest, ParsesSeverities) {
    EXPECT_EQ(cats::log::parse_severity("debug"), boost::log::trivial::debug);
    EXPECT_EQ(cats::log::parse_severity("error"), boost::log::trivial::error);
    EXPECT_THROW(cats::log::parse_severity("loud"), std::invalid_argument);
}

TEST(LogTest, DefaultFilterDropsTraceAndDebug) {
    CapturedLog captured;
    identity_functor(FinCategory::instance());
    FinMap f(1, 1, {1});
    EXPECT_THROW(FinCategory::instance()->compose(f, FinMap(2, 2, {1, 2})), domain_mismatch);
    EXPECT_EQ(captured.text(), "");

    CATS_LOG(warning) << "still shown";
    EXPECT_NE(captured.text().find("[cats] still shown"), std::string::npos);
}

TEST(LogTest, InitAcceptsAnyLevel) {
    CapturedLog captured;
    cats::log::init(boost::log::trivial::trace);
    identity_functor(FinCategory::instance());
    FinMap f(1, 1, {1});
    EXPECT_THROW(FinCategory::instance()->compose(f, FinMap(2, 2, {1, 2})), domain_mismatch);
    cats::log::init();

    std::string text = captured.text();
    EXPECT_NE(text.find("identity functor on Fin"), std::string::npos);
    EXPECT_NE(text.find("compose in Fin"), std::string::npos);
}
