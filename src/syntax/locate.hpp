#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "syntax.hpp"

namespace syntax {

// Non-owning reference to any node that can own a token.
using NodeRef = std::variant<
    const Stmt*,
    const Expr*,
    const Pattern*,
    const SwitchSection*,
    const CaseLabel*,
    const SwitchArm*,
    const WhenClause*,
    const Subpattern*,
    const Designation*,
    const Identifier*,
    const TypeRef*
>;

// Ancestor chain from the root (front) to the located node (back).
using NodePath = std::vector<NodeRef>;

span::Span span_of(const NodeRef& node);
std::vector<NodeRef> children_of(const NodeRef& node);

/**
 * @brief Locate the node whose own tokens cover `offset`.
 *
 * Descends from `root` while some child's span contains `offset`; the node
 * where descent stops is the one that owns the token at `offset` (an
 * operator, a keyword, or a name). Returns nullopt if the root itself does
 * not contain `offset`.
 */
std::optional<NodePath> find_node_at(const StmtPtr& root, uint32_t offset);

} // namespace syntax
