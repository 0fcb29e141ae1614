#pragma once

#include "syntax.hpp"

namespace syntax {

// Structural equality ignoring spans and annotations. Null pointers are only
// equivalent to null pointers.
bool are_equivalent(const Identifier& lhs, const Identifier& rhs);
bool are_equivalent(const TypeRef& lhs, const TypeRef& rhs);
bool are_equivalent(const Designation& lhs, const Designation& rhs);
bool are_equivalent(const Expr& lhs, const Expr& rhs);
bool are_equivalent(const Pattern& lhs, const Pattern& rhs);
bool are_equivalent(const ExprPtr& lhs, const ExprPtr& rhs);
bool are_equivalent(const PatternPtr& lhs, const PatternPtr& rhs);

} // namespace syntax
