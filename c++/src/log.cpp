#include "cats/log.hpp"
#include "cats/errors.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <sstream>
#include <stdexcept>

namespace cats {
namespace log {

namespace {

void set_filter(Severity level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

bool install_default_filter() {
    set_filter(boost::log::trivial::warning);
    return true;
}

} // namespace

boost::log::trivial::logger_type& logger() {
    static const bool defaulted = install_default_filter();
    (void)defaulted;
    return boost::log::trivial::logger::get();
}

void init(Severity level) {
    // Run the one-time default first so it cannot override `level` later.
    logger();
    set_filter(level);
}

Severity parse_severity(const std::string& name) {
    Severity level;
    std::istringstream in(name);
    if (!(in >> level)) {
        throw std::invalid_argument("unknown log level: " + name);
    }
    return level;
}

} // namespace log

void log_error(const category_error& err) {
    CATS_LOG(debug) << err.what();
}

} // namespace cats
