#pragma once

#include "rewrite/term.hpp"

#include <vector>

namespace rewrite {

// Mirror a relational operator for a constant that was written on the left:
// `5 < x` reads as `x > 5`.
syntax::RelationalPattern::Op flip(syntax::RelationalPattern::Op op);

// The pattern a term tests its receiver against.
syntax::PatternPtr create_pattern(const Term& term);

// `n0: { n1: { ... nk: pattern } }` for root-to-leaf `names`.
syntax::Subpattern create_subpattern(const std::vector<syntax::Identifier>& names,
                                     syntax::PatternPtr pattern);

// `{ n0: { ... } }`, or `pattern` itself when `names` is empty.
syntax::PatternPtr wrap_in_subpatterns(const std::vector<syntax::Identifier>& names,
                                       syntax::PatternPtr pattern);

} // namespace rewrite
