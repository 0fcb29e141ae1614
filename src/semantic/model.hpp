#pragma once

#include "semantic/const/const.hpp"
#include "syntax/common.hpp"
#include "syntax/expr.hpp"

#include <optional>

namespace semantic {

enum class SymbolKind { FIELD, PROPERTY, LOCAL, PARAMETER, METHOD, TYPE, CONSTANT };

struct SymbolInfo {
    SymbolKind kind;
    bool is_static = false;
    // The member is declared on a nullable wrapper (`Nullable<T>.Value`,
    // `HasValue`), which has no property-pattern counterpart.
    bool containing_type_is_nullable_wrapper = false;
};

inline bool is_member(SymbolKind kind) {
    return kind == SymbolKind::FIELD || kind == SymbolKind::PROPERTY;
}

/**
 * @brief Semantic queries the rewrite needs from the host compiler.
 *
 * Answers must be stable for the duration of one rewrite call. Implementations
 * may be shared between threads as long as both queries are safe to call
 * concurrently.
 */
class SemanticModel {
public:
    virtual ~SemanticModel() = default;

    virtual std::optional<ConstVariant> constant_value(const syntax::Expr& expr) const = 0;
    virtual std::optional<SymbolInfo> classify(const syntax::Identifier& name) const = 0;
};

} // namespace semantic
