#include <gtest/gtest.h>

#include "src/rewrite/pattern_synthesizer.hpp"
#include "src/rewrite/term_classifier.hpp"
#include "src/utils/error.hpp"
#include "test/rewrite/test_helpers/common.hpp"

namespace {

using namespace syntax::make;
using syntax::Binary;
using syntax::RelationalPattern;

rewrite::Term comparison(Binary::Op op, bool flipped) {
  return rewrite::Term{path("a", {"b"}), rewrite::ComparisonTarget{op, int_lit(5)}, flipped,
                       nullptr};
}

TEST(PatternSynthesizerTest, FlipMirrorsEveryOperator) {
  EXPECT_EQ(rewrite::flip(RelationalPattern::LT), RelationalPattern::GT);
  EXPECT_EQ(rewrite::flip(RelationalPattern::LE), RelationalPattern::GE);
  EXPECT_EQ(rewrite::flip(RelationalPattern::GT), RelationalPattern::LT);
  EXPECT_EQ(rewrite::flip(RelationalPattern::GE), RelationalPattern::LE);
}

TEST(PatternSynthesizerTest, EqualityIgnoresFlip) {
  EXPECT_EQ(syntax::to_source(rewrite::create_pattern(comparison(Binary::EQ, true))), "5");
  EXPECT_EQ(syntax::to_source(rewrite::create_pattern(comparison(Binary::NE, true))),
            "not 5");
}

TEST(PatternSynthesizerTest, RelationalHonorsFlip) {
  EXPECT_EQ(syntax::to_source(rewrite::create_pattern(comparison(Binary::LT, false))), "< 5");
  EXPECT_EQ(syntax::to_source(rewrite::create_pattern(comparison(Binary::LT, true))), "> 5");
  EXPECT_EQ(syntax::to_source(rewrite::create_pattern(comparison(Binary::GE, true))), "<= 5");
}

TEST(PatternSynthesizerTest, NonComparisonOperatorIsRejected) {
  EXPECT_THROW(rewrite::create_pattern(comparison(Binary::ADD, false)), InternalError);
}

TEST(PatternSynthesizerTest, TypeAndPatternTargets) {
  rewrite::Term type_term{ident("o"), syntax::TypeRef("C"), false, nullptr};
  EXPECT_EQ(syntax::to_source(rewrite::create_pattern(type_term)), "C");

  auto pattern = declaration("C", "item");
  rewrite::Term pattern_term{ident("o"), pattern, false, nullptr};
  EXPECT_EQ(rewrite::create_pattern(pattern_term), pattern);
}

TEST(PatternSynthesizerTest, SubpatternNestsRootToLeaf) {
  std::vector<syntax::Identifier> names{syntax::Identifier("b"), syntax::Identifier("c"),
                                        syntax::Identifier("d")};

  auto wrapped = rewrite::wrap_in_subpatterns(names, constant(int_lit(1)));

  EXPECT_EQ(syntax::to_source(wrapped), "{ b: { c: { d: 1 } } }");
}

TEST(PatternSynthesizerTest, NoNamesLeavesPatternUnwrapped) {
  auto pattern = rewrite::true_constant_pattern();

  EXPECT_EQ(rewrite::wrap_in_subpatterns({}, pattern), pattern);
  EXPECT_THROW(rewrite::create_subpattern({}, pattern), InternalError);
}

} // namespace
