#include <gtest/gtest.h>

#include "src/syntax/equivalence.hpp"
#include "src/syntax/factory.hpp"
#include "src/syntax/pretty_print/pretty_print.hpp"

namespace {

using namespace syntax::make;

TEST(EquivalenceTest, IgnoresSpansAndAnnotations) {
  auto laid = syntax::layout(path("a", {"b", "c"}));
  auto annotated = annotate(path("a", {"b", "c"}), syntax::kFormatAnnotation);

  EXPECT_TRUE(laid.root->span.is_valid());
  EXPECT_TRUE(syntax::are_equivalent(laid.root, annotated));
}

TEST(EquivalenceTest, DistinguishesNamesAndOperators) {
  EXPECT_FALSE(syntax::are_equivalent(path("a", {"b"}), path("a", {"c"})));
  EXPECT_FALSE(syntax::are_equivalent(eq(ident("a"), int_lit(1)),
                                      binary(syntax::Binary::NE, ident("a"), int_lit(1))));
  EXPECT_FALSE(syntax::are_equivalent(int_lit(1), bool_lit(true)));
}

TEST(EquivalenceTest, ConditionalAccessIsNotMemberAccess) {
  EXPECT_FALSE(syntax::are_equivalent(conditional(ident("a"), binding("b")),
                                      path("a", {"b"})));
  EXPECT_TRUE(syntax::are_equivalent(conditional(ident("a"), binding("b")),
                                     conditional(ident("a"), binding("b"))));
}

TEST(EquivalenceTest, NullOnlyMatchesNull) {
  syntax::ExprPtr none;
  EXPECT_TRUE(syntax::are_equivalent(none, syntax::ExprPtr{}));
  EXPECT_FALSE(syntax::are_equivalent(none, this_expr()));
}

TEST(EquivalenceTest, ComparesPatternsStructurally) {
  auto lhs = recursive(syntax::TypeRef("C"), {subpattern("P", constant(int_lit(1)))},
                       single("v"));
  auto same = recursive(syntax::TypeRef("C"), {subpattern("P", constant(int_lit(1)))},
                        single("v"));
  auto renamed = recursive(syntax::TypeRef("C"), {subpattern("P", constant(int_lit(1)))},
                           single("w"));
  auto untyped = recursive(std::nullopt, {subpattern("P", constant(int_lit(1)))},
                           single("v"));

  EXPECT_TRUE(syntax::are_equivalent(lhs, same));
  EXPECT_FALSE(syntax::are_equivalent(lhs, renamed));
  EXPECT_FALSE(syntax::are_equivalent(lhs, untyped));
  EXPECT_FALSE(syntax::are_equivalent(var_pattern("v"), declaration("C", "v")));
}

TEST(EquivalenceTest, ComparesDesignations) {
  EXPECT_TRUE(syntax::are_equivalent(parenthesized({single("a"), discard_designation()}),
                                     parenthesized({single("a"), discard_designation()})));
  EXPECT_FALSE(syntax::are_equivalent(parenthesized({single("a")}), single("a")));
}

} // namespace
