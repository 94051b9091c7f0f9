#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cats {

class category_error : public std::runtime_error {
public:
    category_error(const std::string& msg) : std::runtime_error(msg) {}
};

// An operation of a bare Category or Functor base was called.
class not_implemented : public category_error {
public:
    not_implemented(const std::string& what, const std::string& where)
        : category_error(what + " is not implemented for " + where) {}
};

// compose(f, g) with codom(f) != dom(g).
class domain_mismatch : public category_error {
public:
    domain_mismatch(const std::string& msg) : category_error(msg) {}
};

// Functor composition with codom(F) != dom(G).
class composition_mismatch : public category_error {
public:
    composition_mismatch(const std::string& msg) : category_error(msg) {}
};

class key_not_found : public category_error {
public:
    key_not_found(const std::string& msg) : category_error(msg) {}
};

class invalid_morphism : public category_error {
public:
    invalid_morphism(const std::string& msg) : category_error(msg) {}
};

// A required category or functor pointer was null.
class null_argument : public category_error {
public:
    null_argument(const std::string& msg) : category_error(msg) {}
};

class type_mismatch : public category_error {
public:
    type_mismatch(const std::string& msg) : category_error(msg) {}
};

void log_error(const category_error& err);

// Logs the error at debug severity, then throws it.
template <typename E, typename... Args>
[[noreturn]] void raise(Args&&... args) {
    E err(std::forward<Args>(args)...);
    log_error(err);
    throw err;
}

} // namespace cats
