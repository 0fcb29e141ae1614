#include "chain_decomposer.hpp"

#include "syntax/factory.hpp"
#include "utils/error.hpp"
#include "utils/helpers.hpp"

namespace rewrite {

namespace {

void validate_symbol(const semantic::SymbolInfo& info, const syntax::Identifier& name) {
    const bool never_static = info.kind == semantic::SymbolKind::LOCAL ||
                              info.kind == semantic::SymbolKind::PARAMETER ||
                              info.kind == semantic::SymbolKind::TYPE;
    if (never_static && info.is_static) {
        error_helper::oracle_inconsistency("'" + name.name + "' reported static",
                                           name.span);
    }
    if (!semantic::is_member(info.kind) && info.containing_type_is_nullable_wrapper) {
        error_helper::oracle_inconsistency(
            "non-member '" + name.name + "' reported on a nullable wrapper", name.span);
    }
}

class ChainWalker {
public:
    ChainWalker(const semantic::SemanticModel& model, std::vector<ChainName>& names)
        : model_(model), names_(names) {}

    // Returns the receiver left after peeling convertible names off `node`.
    // `scope` is the conditional access whose `?.` part is being walked.
    syntax::ExprPtr walk(const syntax::ExprPtr& node, const syntax::ExprPtr& scope) {
        return std::visit(
            Overloaded{
                [&](const syntax::IdentifierName& id) -> syntax::ExprPtr {
                    if (!is_convertible_member(id.name, model_)) {
                        return node;
                    }
                    names_.push_back(ChainName{id.name, node.get(), nullptr});
                    return nullptr;
                },
                [&](const syntax::MemberBinding& binding) -> syntax::ExprPtr {
                    if (!scope) {
                        error_helper::unexpected_shape(
                            "member binding outside a conditional access", node->span);
                    }
                    if (!is_convertible_member(binding.name, model_)) {
                        return node;
                    }
                    const auto& access = std::get<syntax::ConditionalAccess>(scope->value);
                    names_.push_back(ChainName{binding.name, scope.get(), access.expr});
                    return nullptr;
                },
                [&](const syntax::MemberAccess& access) -> syntax::ExprPtr {
                    if (!is_convertible_member(access.name, model_)) {
                        return node;
                    }
                    names_.push_back(ChainName{access.name, node.get(), access.expr});
                    return walk(access.expr, scope);
                },
                [&](const syntax::ConditionalAccess& access) -> syntax::ExprPtr {
                    auto rest = walk(access.when_not_null, node);
                    if (rest == access.when_not_null) {
                        return node;
                    }
                    if (rest) {
                        return syntax::make::conditional(access.expr, rest);
                    }
                    return walk(access.expr, scope);
                },
                [&](const auto&) -> syntax::ExprPtr { return node; }},
            node->value);
    }

private:
    const semantic::SemanticModel& model_;
    std::vector<ChainName>& names_;
};

} // namespace

std::vector<ChainName> ChainDecomposition::root_to_leaf() const {
    return std::vector<ChainName>(names.rbegin(), names.rend());
}

bool is_convertible_member(const syntax::Identifier& name,
                           const semantic::SemanticModel& model) {
    auto info = model.classify(name);
    if (!info) {
        return false;
    }
    validate_symbol(*info, name);
    return semantic::is_member(info->kind) && !info->is_static &&
           !info->containing_type_is_nullable_wrapper;
}

ChainDecomposition decompose_chain(const syntax::ExprPtr& expr,
                                   const semantic::SemanticModel& model) {
    if (!expr) {
        error_helper::invariant_violation("decomposing a null expression");
    }
    ChainDecomposition result;
    ChainWalker walker(model, result.names);
    result.receiver = walker.walk(expr, nullptr);
    return result;
}

} // namespace rewrite
