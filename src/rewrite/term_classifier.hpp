#pragma once

#include "rewrite/term.hpp"
#include "semantic/model.hpp"

#include <optional>

namespace rewrite {

// A plain `&&` is read at its right operand (the operand adjacent to the
// operator the cursor is on, since `&&` associates left). A when clause is
// read at its leftmost operand, the one that directly follows the pattern.
enum class TermMode { LOGICAL_AND, WHEN_CLAUSE };

const syntax::PatternPtr& true_constant_pattern();
const syntax::PatternPtr& false_constant_pattern();

std::optional<Term> classify_term(const syntax::ExprPtr& expr,
                                  const semantic::SemanticModel& model,
                                  TermMode mode = TermMode::LOGICAL_AND);

} // namespace rewrite
