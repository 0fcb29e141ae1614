#include <gtest/gtest.h>

#include "src/semantic/const/evaluator.hpp"
#include "src/semantic/declared_model.hpp"
#include "src/syntax/factory.hpp"

#include <limits>

namespace {

using namespace syntax::make;
using semantic::ConstVariant;

class DeclaredModelTest : public ::testing::Test {
protected:
  void SetUp() override {
    model.declare_local("x")
        .declare_property("Length")
        .declare_field("count")
        .declare_static_property("Empty")
        .declare_constant("Max", semantic::IntConst{10})
        .declare_constant("Color.Red", semantic::IntConst{1});
  }

  semantic::DeclaredSemanticModel model;
};

TEST_F(DeclaredModelTest, ClassifiesDeclaredNames) {
  auto length = model.classify(syntax::Identifier("Length"));
  ASSERT_TRUE(length);
  EXPECT_EQ(length->kind, semantic::SymbolKind::PROPERTY);
  EXPECT_FALSE(length->is_static);

  auto empty = model.classify(syntax::Identifier("Empty"));
  ASSERT_TRUE(empty);
  EXPECT_TRUE(empty->is_static);

  EXPECT_EQ(model.classify(syntax::Identifier("count"))->kind, semantic::SymbolKind::FIELD);
  EXPECT_EQ(model.classify(syntax::Identifier("x"))->kind, semantic::SymbolKind::LOCAL);
  EXPECT_FALSE(model.classify(syntax::Identifier("unknown")));
}

TEST_F(DeclaredModelTest, SimpleConstantIsAStaticSymbol) {
  auto max = model.classify(syntax::Identifier("Max"));

  ASSERT_TRUE(max);
  EXPECT_EQ(max->kind, semantic::SymbolKind::CONSTANT);
  EXPECT_TRUE(max->is_static);
  EXPECT_FALSE(model.classify(syntax::Identifier("Color.Red")));
}

TEST_F(DeclaredModelTest, FoldsLiteralsAndNamedConstants) {
  EXPECT_EQ(model.constant_value(*int_lit(3)), ConstVariant{semantic::IntConst{3}});
  EXPECT_EQ(model.constant_value(*null_lit()), ConstVariant{semantic::NullConst{}});
  EXPECT_EQ(model.constant_value(*ident("Max")), ConstVariant{semantic::IntConst{10}});
  EXPECT_EQ(model.constant_value(*path("Color", {"Red"})), ConstVariant{semantic::IntConst{1}});
  EXPECT_EQ(model.constant_value(*binary(syntax::Binary::ADD, ident("Max"), int_lit(5))),
            ConstVariant{semantic::IntConst{15}});
  EXPECT_EQ(model.constant_value(*unary(syntax::Unary::NEGATE, paren(int_lit(2)))),
            ConstVariant{semantic::IntConst{-2}});
  EXPECT_EQ(model.constant_value(*binary(syntax::Binary::ADD, string_lit("a"), string_lit("b"))),
            ConstVariant{semantic::StringConst{"ab"}});
}

TEST_F(DeclaredModelTest, NonConstantExpressions) {
  EXPECT_FALSE(model.constant_value(*ident("x")));
  EXPECT_FALSE(model.constant_value(*path("x", {"Length"})));
  EXPECT_FALSE(model.constant_value(*call(ident("F"))));
  EXPECT_FALSE(model.constant_value(*binary(syntax::Binary::ADD, ident("x"), int_lit(1))));
  EXPECT_FALSE(model.constant_value(*conditional(ident("Color"), binding("Red"))));
}

TEST_F(DeclaredModelTest, OverflowDoesNotFold) {
  auto max = int_lit(std::numeric_limits<int64_t>::max());

  EXPECT_FALSE(model.constant_value(*binary(syntax::Binary::ADD, max, int_lit(1))));
  EXPECT_FALSE(model.constant_value(
      *unary(syntax::Unary::NEGATE, int_lit(std::numeric_limits<int64_t>::min()))));
}

TEST(ConstEvalTest, QualifiedNames) {
  EXPECT_EQ(semantic::const_eval::qualified_name(*path("A", {"B", "C"})), "A.B.C");
  EXPECT_FALSE(semantic::const_eval::qualified_name(*member(call(ident("F")), "B")));
}

TEST(ConstEvalTest, ComparisonsFoldToBooleans) {
  auto folded = semantic::const_eval::evaluate(
      *binary(syntax::Binary::LT, int_lit(1), int_lit(2)), nullptr);

  EXPECT_EQ(folded, ConstVariant{semantic::BoolConst{true}});
  EXPECT_FALSE(semantic::const_eval::evaluate(*ident("Max"), nullptr));
}

} // namespace
