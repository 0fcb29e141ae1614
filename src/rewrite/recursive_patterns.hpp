#pragma once

#include "semantic/model.hpp"
#include "syntax/locate.hpp"
#include "syntax/syntax.hpp"

#include <functional>
#include <optional>
#include <variant>

namespace rewrite {

inline constexpr const char* kRewriteTitle = "Use recursive patterns";

// `a && b`, with the cursor on the `&&`.
struct LogicalAndFragment { const syntax::Expr* expr; };
// `case P when c:`, with the cursor on `case` or `when`.
struct CaseLabelFragment { const syntax::CaseLabel* label; };
// `P when c => r`, with the cursor on `=>` or `when`.
struct SwitchArmFragment { const syntax::SwitchArm* arm; };

using Fragment = std::variant<LogicalAndFragment, CaseLabelFragment, SwitchArmFragment>;

// Applies the rewrite to the tree the fragment was taken from. The edit is
// keyed by node identity, so the function must be given that same root (or
// a tree sharing the rewritten nodes) while it is still alive.
using ReplacementFunction = std::function<syntax::StmtPtr(const syntax::StmtPtr&)>;

// The rewritable fragment owning the last node of `path`, if any.
std::optional<Fragment> fragment_at(const syntax::NodePath& path);

/**
 * @brief Build the rewrite for an already located fragment.
 *
 * All analysis happens here; nullopt means the fragment has no equivalent
 * pattern form. A returned function only performs the edit.
 */
std::optional<ReplacementFunction> try_build_rewrite(const Fragment& fragment,
                                                     const semantic::SemanticModel& model);

// Cursor entry point: an empty `selection` at the token to rewrite.
std::optional<ReplacementFunction> try_build_rewrite(const syntax::StmtPtr& root,
                                                     span::Span selection,
                                                     const semantic::SemanticModel& model);

// The guard left after its leftmost operand moved into the pattern:
// `a && b && c` leaves `b && c`, a single operand leaves nothing.
std::optional<syntax::ExprPtr> remove_leftmost_operand(const syntax::ExprPtr& condition);

} // namespace rewrite
