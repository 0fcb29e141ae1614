#pragma once

#include <stdexcept>
#include <string>

#include "../span/span.hpp"
#include "debug_context.hpp"

// Raised when a tree or an oracle answer breaks a structural contract the
// rewrite relies on. These are defects in the caller or in dispatch, never an
// expected "no rewrite" outcome.
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& message,
                           span::Span span = span::Span::invalid())
        : std::logic_error(message), span_(span) {}

    span::Span span() const { return span_; }

protected:
    span::Span span_ = span::Span::invalid();
};

namespace semantic {

class OracleInconsistency : public InternalError {
public:
    explicit OracleInconsistency(const std::string& message,
                                 span::Span span = span::Span::invalid())
        : InternalError(message, span) {}
};

} // namespace semantic

namespace error_helper {

/**
 * @brief Report a node shape that the current stage never expects to see
 */
[[noreturn]] inline void unexpected_shape(const std::string& what,
                                          span::Span span = span::Span::invalid()) {
    throw InternalError(debug::format_with_context("unexpected " + what), span);
}

[[noreturn]] inline void invariant_violation(const std::string& what,
                                             span::Span span = span::Span::invalid()) {
    throw InternalError(
        debug::format_with_context(what + " - invariant violation"), span);
}

[[noreturn]] inline void oracle_inconsistency(const std::string& what,
                                              span::Span span = span::Span::invalid()) {
    throw semantic::OracleInconsistency(
        debug::format_with_context("inconsistent semantic model: " + what), span);
}

} // namespace error_helper
