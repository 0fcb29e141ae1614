#pragma once

#include "semantic/model.hpp"
#include "syntax/syntax.hpp"

#include <optional>
#include <vector>

namespace rewrite {

// A variable introduced by an existing pattern that a later term reads from.
struct DesignationMatch {
    // The var, declaration or recursive pattern that owns the designation.
    syntax::PatternPtr containing;
    syntax::Designation designation;
    // Root-to-leaf member names between the variable and the tested value;
    // empty when the term tests the variable itself.
    std::vector<syntax::Identifier> names;
};

/**
 * @brief Find the designation in `pattern` that introduces the base variable
 * of `receiver`.
 *
 * `receiver` must decompose to a plain identifier followed by zero or more
 * convertible members. The first single-variable designation with that name,
 * in document order, is taken; it must sit directly on a var, declaration or
 * recursive pattern (not inside a parenthesized designation list).
 */
std::optional<DesignationMatch> find_variable_designation(const syntax::PatternPtr& pattern,
                                                          const syntax::ExprPtr& receiver,
                                                          const semantic::SemanticModel& model);

/**
 * @brief Fold `generated` into the pattern that owns the matched designation.
 *
 * With member names, `generated` becomes a nested property subpattern of the
 * containing pattern; a recursive pattern that already tests the first name
 * is left alone (nullopt). Without names the two shapes merge
 * (`var x` + `T` gives `T x`), falling back to `(containing) and (generated)`.
 * The result keeps the containing pattern's designation and carries the
 * format and simplify annotations.
 */
std::optional<syntax::PatternPtr> rewrite_containing_pattern(
    const syntax::PatternPtr& containing,
    const syntax::PatternPtr& generated,
    const std::vector<syntax::Identifier>& names);

} // namespace rewrite
