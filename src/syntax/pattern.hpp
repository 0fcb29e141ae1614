#pragma once

#include "common.hpp"

namespace syntax {

struct Subpattern {
    std::optional<Identifier> name; // absent for positional subpatterns
    PatternPtr pattern;
    span::Span span = span::Span::invalid();
};

// --- Concrete Pattern Nodes ---
struct VarPattern { Designation designation; };

struct DeclarationPattern {
    TypeRef type;
    Designation designation;
};

// `Type (positional) { name: pattern, ... } designation`
struct RecursivePattern {
    std::optional<TypeRef> type;
    std::optional<std::vector<Subpattern>> positional;
    std::optional<std::vector<Subpattern>> properties;
    std::optional<Designation> designation;
};

struct ConstantPattern { ExprPtr value; };

struct RelationalPattern {
    enum Op { LT, LE, GT, GE };
    Op op;
    ExprPtr value;
};

struct TypePattern { TypeRef type; };
struct NotPattern { PatternPtr pattern; };

struct BinaryPattern {
    enum Op { AND, OR };
    Op op;
    PatternPtr left, right;
};

struct ParenthesizedPattern { PatternPtr pattern; };
struct DiscardPattern {};

// --- Variant and Wrapper ---
using PatternVariant = std::variant<
    VarPattern,
    DeclarationPattern,
    RecursivePattern,
    ConstantPattern,
    RelationalPattern,
    TypePattern,
    NotPattern,
    BinaryPattern,
    ParenthesizedPattern,
    DiscardPattern
>;

struct Pattern {
    PatternVariant value;
    span::Span span = span::Span::invalid();
    Annotations annotations{};
    Pattern(PatternVariant &&v, span::Span span = span::Span::invalid())
        : value(std::move(v)), span(span) {}
};

} // namespace syntax
