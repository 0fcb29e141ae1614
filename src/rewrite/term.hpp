#pragma once

#include "syntax/syntax.hpp"

#include <variant>

namespace rewrite {

// `receiver <op> constant` after normalization; `op` is the operator as written.
struct ComparisonTarget {
    syntax::Binary::Op op;
    syntax::ExprPtr constant;
};

// What a boolean test checks its receiver against: a constant comparison, a
// type (`e is T`) or a pattern (`e is P`, or the shared true/false pattern).
using Target = std::variant<ComparisonTarget, syntax::TypeRef, syntax::PatternPtr>;

struct Term {
    syntax::ExprPtr receiver;
    Target target;
    // The constant was the left operand, so relational operators read backwards.
    bool flipped = false;
    // The operand the term was read from (the comparison, `is` test, `!x` or
    // bare expression), never a `&&`.
    syntax::ExprPtr source;
};

} // namespace rewrite
