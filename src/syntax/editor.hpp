#pragma once

#include <unordered_map>

#include "syntax.hpp"

namespace syntax {

/**
 * @brief Pure, identity-keyed tree editor.
 *
 * Replacements are recorded against node addresses in an existing tree and
 * applied by rebuilding only the ancestors of replaced nodes. Replacement
 * nodes are inserted as given; they are not searched for further edits.
 * A tree without any recorded node comes back pointer-identical.
 */
class SyntaxEditor {
public:
    void replace(const Expr& target, ExprPtr replacement);
    void replace(const Pattern& target, PatternPtr replacement);
    void replace(const CaseLabel& target, CaseLabel replacement);
    void replace(const SwitchArm& target, SwitchArm replacement);

    bool empty() const;

    StmtPtr apply(const StmtPtr& root) const;
    ExprPtr apply(const ExprPtr& root) const;
    PatternPtr apply(const PatternPtr& root) const;

private:
    std::unordered_map<const Expr*, ExprPtr> exprs_;
    std::unordered_map<const Pattern*, PatternPtr> patterns_;
    std::unordered_map<const CaseLabel*, CaseLabel> labels_;
    std::unordered_map<const SwitchArm*, SwitchArm> arms_;

    friend class EditApplier;
};

} // namespace syntax
