#include "pattern_merger.hpp"

#include "rewrite/chain_decomposer.hpp"
#include "rewrite/pattern_synthesizer.hpp"
#include "syntax/equivalence.hpp"
#include "syntax/factory.hpp"
#include "utils/debug_context.hpp"
#include "utils/error.hpp"
#include "utils/helpers.hpp"

namespace rewrite {

namespace {

struct FoundDesignation {
    syntax::PatternPtr container;
    syntax::Designation designation;
    // False when the variable sits inside a parenthesized designation list.
    bool direct;
};

bool designation_declares(const syntax::Designation& designation, const std::string& name) {
    return std::visit(
        Overloaded{
            [&](const syntax::SingleVariable& single) { return single.name.name == name; },
            [](const syntax::DiscardDesignation&) { return false; },
            [&](const syntax::ParenthesizedVariables& list) {
                for (const auto& variable : list.variables) {
                    if (designation_declares(variable, name)) {
                        return true;
                    }
                }
                return false;
            }},
        designation.value);
}

class DesignationFinder {
public:
    explicit DesignationFinder(const std::string& name) : name_(name) {}

    std::optional<FoundDesignation> find(const syntax::PatternPtr& pattern) const {
        if (!pattern) {
            return std::nullopt;
        }
        return std::visit(
            Overloaded{
                [&](const syntax::VarPattern& var) {
                    return check(pattern, var.designation);
                },
                [&](const syntax::DeclarationPattern& decl) {
                    return check(pattern, decl.designation);
                },
                [&](const syntax::RecursivePattern& recursive) -> std::optional<FoundDesignation> {
                    for (const auto* clause : {&recursive.positional, &recursive.properties}) {
                        if (!*clause) {
                            continue;
                        }
                        for (const auto& sub : **clause) {
                            if (auto found = find(sub.pattern)) {
                                return found;
                            }
                        }
                    }
                    if (recursive.designation) {
                        return check(pattern, *recursive.designation);
                    }
                    return std::nullopt;
                },
                [&](const syntax::NotPattern& negated) { return find(negated.pattern); },
                [&](const syntax::BinaryPattern& binary) -> std::optional<FoundDesignation> {
                    if (auto found = find(binary.left)) {
                        return found;
                    }
                    return find(binary.right);
                },
                [&](const syntax::ParenthesizedPattern& paren) { return find(paren.pattern); },
                [](const auto&) -> std::optional<FoundDesignation> { return std::nullopt; }},
            pattern->value);
    }

private:
    std::optional<FoundDesignation> check(const syntax::PatternPtr& container,
                                          const syntax::Designation& designation) const {
        if (auto single = std::get_if<syntax::SingleVariable>(&designation.value)) {
            if (single->name.name == name_) {
                return FoundDesignation{container, designation, true};
            }
            return std::nullopt;
        }
        if (designation_declares(designation, name_)) {
            return FoundDesignation{container, designation, false};
        }
        return std::nullopt;
    }

    const std::string& name_;
};

std::optional<syntax::Designation> designation_of(const syntax::Pattern& pattern) {
    if (auto var = std::get_if<syntax::VarPattern>(&pattern.value)) {
        return var->designation;
    }
    if (auto decl = std::get_if<syntax::DeclarationPattern>(&pattern.value)) {
        return decl->designation;
    }
    if (auto recursive = std::get_if<syntax::RecursivePattern>(&pattern.value)) {
        return recursive->designation;
    }
    return std::nullopt;
}

bool contains_designation(const syntax::PatternPtr& pattern,
                          const syntax::Designation& designation) {
    if (!pattern) {
        return false;
    }
    if (auto own = designation_of(*pattern)) {
        if (syntax::are_equivalent(*own, designation)) {
            return true;
        }
    }
    return std::visit(
        Overloaded{
            [&](const syntax::RecursivePattern& recursive) {
                for (const auto* clause : {&recursive.positional, &recursive.properties}) {
                    if (!*clause) {
                        continue;
                    }
                    for (const auto& sub : **clause) {
                        if (contains_designation(sub.pattern, designation)) {
                            return true;
                        }
                    }
                }
                return false;
            },
            [&](const syntax::NotPattern& negated) {
                return contains_designation(negated.pattern, designation);
            },
            [&](const syntax::BinaryPattern& binary) {
                return contains_designation(binary.left, designation) ||
                       contains_designation(binary.right, designation);
            },
            [&](const syntax::ParenthesizedPattern& paren) {
                return contains_designation(paren.pattern, designation);
            },
            [](const auto&) { return false; }},
        pattern->value);
}

syntax::PatternPtr parenthesize(const syntax::PatternPtr& pattern) {
    return syntax::make::annotate(syntax::make::paren_pattern(pattern),
                                  syntax::kSimplifyAnnotation);
}

// Shape merges for a term that tests the designated variable itself.
syntax::PatternPtr merge_shapes(const syntax::PatternPtr& containing,
                                const syntax::PatternPtr& generated) {
    const auto* generated_recursive = std::get_if<syntax::RecursivePattern>(&generated->value);
    const auto* generated_type = std::get_if<syntax::TypePattern>(&generated->value);

    if (auto var = std::get_if<syntax::VarPattern>(&containing->value)) {
        if (generated_recursive && !generated_recursive->designation) {
            auto merged = *generated_recursive;
            merged.designation = var->designation;
            return syntax::make::recursive(std::move(merged));
        }
        if (generated_type) {
            return std::make_shared<const syntax::Pattern>(
                syntax::DeclarationPattern{generated_type->type, var->designation});
        }
    }
    if (auto decl = std::get_if<syntax::DeclarationPattern>(&containing->value)) {
        if (generated_recursive && !generated_recursive->type &&
            !generated_recursive->designation) {
            auto merged = *generated_recursive;
            merged.type = decl->type;
            merged.designation = decl->designation;
            return syntax::make::recursive(std::move(merged));
        }
    }
    if (auto recursive = std::get_if<syntax::RecursivePattern>(&containing->value)) {
        if (!recursive->type && generated_type) {
            auto merged = *recursive;
            merged.type = generated_type->type;
            return syntax::make::recursive(std::move(merged));
        }
    }
    return syntax::make::and_pattern(parenthesize(containing), parenthesize(generated));
}

std::optional<syntax::PatternPtr> add_subpattern(const syntax::PatternPtr& containing,
                                                 syntax::Subpattern sub) {
    return std::visit(
        Overloaded{
            [&](const syntax::VarPattern& var) -> std::optional<syntax::PatternPtr> {
                return syntax::make::recursive(std::nullopt, {std::move(sub)}, var.designation);
            },
            [&](const syntax::DeclarationPattern& decl) -> std::optional<syntax::PatternPtr> {
                return syntax::make::recursive(decl.type, {std::move(sub)}, decl.designation);
            },
            [&](const syntax::RecursivePattern& recursive) -> std::optional<syntax::PatternPtr> {
                auto merged = recursive;
                if (!merged.properties) {
                    merged.properties.emplace();
                }
                for (const auto& existing : *merged.properties) {
                    if (existing.name && syntax::are_equivalent(*existing.name, *sub.name)) {
                        return std::nullopt;
                    }
                }
                merged.properties->push_back(std::move(sub));
                return syntax::make::recursive(std::move(merged));
            },
            [&](const auto&) -> std::optional<syntax::PatternPtr> {
                error_helper::unexpected_shape("pattern owning a designation", containing->span);
            }},
        containing->value);
}

} // namespace

std::optional<DesignationMatch> find_variable_designation(const syntax::PatternPtr& pattern,
                                                          const syntax::ExprPtr& receiver,
                                                          const semantic::SemanticModel& model) {
    auto chain = decompose_chain(receiver, model);
    if (!chain.receiver) {
        return std::nullopt;
    }
    const auto* variable = std::get_if<syntax::IdentifierName>(&chain.receiver->value);
    if (!variable) {
        return std::nullopt;
    }
    auto found = DesignationFinder(variable->name.name).find(pattern);
    if (!found || !found->direct) {
        return std::nullopt;
    }

    DesignationMatch match;
    match.containing = found->container;
    match.designation = found->designation;
    for (const auto& name : chain.root_to_leaf()) {
        match.names.push_back(name.name);
    }
    return match;
}

std::optional<syntax::PatternPtr> rewrite_containing_pattern(
    const syntax::PatternPtr& containing,
    const syntax::PatternPtr& generated,
    const std::vector<syntax::Identifier>& names) {
    if (!containing || !generated) {
        error_helper::invariant_violation("merging a null pattern");
    }
    auto guard = debug::push("merge", names.empty() ? "shape" : "subpattern");
    auto original = designation_of(*containing);
    if (!original) {
        error_helper::unexpected_shape("pattern without a designation", containing->span);
    }

    std::optional<syntax::PatternPtr> rewritten;
    if (names.empty()) {
        rewritten = merge_shapes(containing, generated);
    } else {
        rewritten = add_subpattern(containing, create_subpattern(names, generated));
    }
    if (!rewritten) {
        return std::nullopt;
    }
    if (!contains_designation(*rewritten, *original)) {
        error_helper::invariant_violation("merged pattern dropped its designation",
                                          containing->span);
    }
    return syntax::make::annotate(
        *rewritten, syntax::kFormatAnnotation.merged(syntax::kSimplifyAnnotation));
}

} // namespace rewrite
