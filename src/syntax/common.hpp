#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../span/span.hpp"

namespace syntax {

// Forward declare the variant wrapper structs to break recursion
struct Expr;
struct Pattern;
struct Stmt;

// Trees are immutable and structurally shared: a rewrite returns a new root
// that reuses every subtree it did not touch.
using ExprPtr = std::shared_ptr<const Expr>;
using PatternPtr = std::shared_ptr<const Pattern>;
using StmtPtr = std::shared_ptr<const Stmt>;

struct Identifier {
    std::string name;
    span::Span span = span::Span::invalid();
    Identifier() = default;
    Identifier(std::string name) : name(std::move(name)) {};
    Identifier(const char* name) : name(name) {};

    bool operator==(const Identifier& other) const noexcept {
        return name == other.name;
    }
};

// A type reference as written, e.g. `C`, `System.String`, `int?`.
struct TypeRef {
    std::string name;
    span::Span span = span::Span::invalid();
    TypeRef() = default;
    TypeRef(std::string name) : name(std::move(name)) {};
    TypeRef(const char* name) : name(name) {};
};

// Markers for downstream passes. `format` allows re-indentation, `simplify`
// allows removal of redundant parentheses and unused designations.
struct Annotations {
    bool format = false;
    bool simplify = false;

    Annotations merged(Annotations other) const {
        return Annotations{format || other.format, simplify || other.simplify};
    }
    bool any() const { return format || simplify; }
};

inline constexpr Annotations kFormatAnnotation{true, false};
inline constexpr Annotations kSimplifyAnnotation{false, true};

// --- Variable designations ---
struct Designation;

struct SingleVariable {
    Identifier name;
};

struct DiscardDesignation {};

struct ParenthesizedVariables {
    std::vector<Designation> variables;
};

using DesignationVariant =
    std::variant<SingleVariable, DiscardDesignation, ParenthesizedVariables>;

struct Designation {
    DesignationVariant value;
    span::Span span = span::Span::invalid();
};

} // namespace syntax

namespace std {
template <>
struct hash<syntax::Identifier> {
    size_t operator()(const syntax::Identifier& id) const noexcept {
        return std::hash<std::string>{}(id.name);
    }
};
} // namespace std
