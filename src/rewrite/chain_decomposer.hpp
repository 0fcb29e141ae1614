#pragma once

#include "semantic/model.hpp"
#include "syntax/syntax.hpp"

#include <vector>

namespace rewrite {

// One convertible member name of an access chain.
struct ChainName {
    syntax::Identifier name;
    // Replacing `owner` by `owner_receiver` inside the chain yields the
    // expression the member was read from. For `a.b` the owner is the access
    // itself; for a binding `?.b` it is the enclosing conditional access.
    // `owner_receiver` is null for an implicit `this` member.
    const syntax::Expr* owner = nullptr;
    syntax::ExprPtr owner_receiver;
};

struct ChainDecomposition {
    // The non-decomposable base; null when the chain starts at an implicit `this`.
    syntax::ExprPtr receiver;
    // Leaf-to-root: `a.b.c` gives [c, b].
    std::vector<ChainName> names;

    bool empty() const { return names.empty(); }
    std::vector<ChainName> root_to_leaf() const;
};

/**
 * @brief Split a member-access chain into its receiver and the names that
 * can become property subpatterns.
 *
 * Decomposition stops at the first name that is not an instance field or
 * property, and at any expression that is not a name, member access or
 * conditional access. A conditional access whose `?.` part stops early keeps
 * its `?.` in the receiver: `a?.M().b` has receiver `a?.M()` and names [b].
 * Decomposing the returned receiver again yields no further names.
 */
ChainDecomposition decompose_chain(const syntax::ExprPtr& expr,
                                   const semantic::SemanticModel& model);

// Instance field or property not declared on a nullable wrapper. Throws
// semantic::OracleInconsistency on a self-contradicting answer.
bool is_convertible_member(const syntax::Identifier& name,
                           const semantic::SemanticModel& model);

} // namespace rewrite
