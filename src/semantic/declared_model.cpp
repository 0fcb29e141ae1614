#include "declared_model.hpp"

#include "semantic/const/evaluator.hpp"

#include <utility>

namespace semantic {

DeclaredSemanticModel& DeclaredSemanticModel::declare(std::string name,
                                                      SymbolInfo info) {
  symbols_.insert_or_assign(std::move(name), info);
  return *this;
}

DeclaredSemanticModel& DeclaredSemanticModel::declare_field(std::string name) {
  return declare(std::move(name), SymbolInfo{SymbolKind::FIELD});
}

DeclaredSemanticModel& DeclaredSemanticModel::declare_property(std::string name) {
  return declare(std::move(name), SymbolInfo{SymbolKind::PROPERTY});
}

DeclaredSemanticModel&
DeclaredSemanticModel::declare_static_property(std::string name) {
  return declare(std::move(name), SymbolInfo{.kind = SymbolKind::PROPERTY,
                                             .is_static = true});
}

DeclaredSemanticModel& DeclaredSemanticModel::declare_local(std::string name) {
  return declare(std::move(name), SymbolInfo{SymbolKind::LOCAL});
}

DeclaredSemanticModel& DeclaredSemanticModel::declare_constant(std::string name,
                                                               ConstVariant value) {
  if (name.find('.') == std::string::npos) {
    symbols_.insert_or_assign(name, SymbolInfo{.kind = SymbolKind::CONSTANT,
                                               .is_static = true});
  }
  constants_.insert_or_assign(std::move(name), std::move(value));
  return *this;
}

std::optional<ConstVariant>
DeclaredSemanticModel::constant_value(const syntax::Expr& expr) const {
  return const_eval::evaluate(
      expr, [this](const std::string& name) -> std::optional<ConstVariant> {
        auto it = constants_.find(name);
        if (it == constants_.end()) {
          return std::nullopt;
        }
        return it->second;
      });
}

std::optional<SymbolInfo>
DeclaredSemanticModel::classify(const syntax::Identifier& name) const {
  auto it = symbols_.find(name.name);
  if (it == symbols_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace semantic
