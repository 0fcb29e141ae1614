#pragma once

#include "semantic/model.hpp"

#include <string>
#include <unordered_map>

namespace semantic {

/**
 * @brief A semantic model backed by explicit declarations.
 *
 * Names resolve by spelling only. Hosts without a compiler front end, and the
 * tests, declare the members, locals and constants a fragment refers to.
 */
class DeclaredSemanticModel : public SemanticModel {
public:
    DeclaredSemanticModel& declare(std::string name, SymbolInfo info);
    DeclaredSemanticModel& declare_field(std::string name);
    DeclaredSemanticModel& declare_property(std::string name);
    DeclaredSemanticModel& declare_static_property(std::string name);
    DeclaredSemanticModel& declare_local(std::string name);
    // Registers a named constant; `Color.Red` style names are allowed.
    DeclaredSemanticModel& declare_constant(std::string name, ConstVariant value);

    std::optional<ConstVariant> constant_value(const syntax::Expr& expr) const override;
    std::optional<SymbolInfo> classify(const syntax::Identifier& name) const override;

private:
    std::unordered_map<std::string, SymbolInfo> symbols_;
    std::unordered_map<std::string, ConstVariant> constants_;
};

} // namespace semantic
