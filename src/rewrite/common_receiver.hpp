#pragma once

#include "semantic/model.hpp"
#include "syntax/syntax.hpp"

#include <optional>
#include <vector>

namespace rewrite {

struct CommonReceiver {
    // Null when both chains start at an implicit `this`.
    syntax::ExprPtr receiver;
    // Root-to-leaf names below the shared receiver; neither is ever empty.
    std::vector<syntax::Identifier> left_names;
    std::vector<syntax::Identifier> right_names;
};

/**
 * @brief Find the longest shared prefix of two member-access chains.
 *
 * Both operands must decompose to at least one name over equivalent base
 * receivers. The shared prefix never consumes the last name of either side,
 * so `a.b` and `a.b.c` share only `a`. The prefix names move back into the
 * returned receiver: `a.b.c` and `a.b.d` share `a.b` with [c] and [d] left.
 */
std::optional<CommonReceiver> resolve_common_receiver(const syntax::ExprPtr& left,
                                                      const syntax::ExprPtr& right,
                                                      const semantic::SemanticModel& model);

} // namespace rewrite
