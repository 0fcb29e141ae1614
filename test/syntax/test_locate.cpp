#include <gtest/gtest.h>

#include "src/syntax/factory.hpp"
#include "src/syntax/locate.hpp"
#include "src/syntax/pretty_print/pretty_print.hpp"

namespace {

using namespace syntax::make;

class LocateTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto label = case_label(declaration("C", "c"), logical_and(ident("x"), ident("y")));
    laid = syntax::layout(
        switch_stmt(ident("o"), {section({label}, {return_stmt(path("c", {"P"}))})}));
  }

  std::optional<syntax::NodePath> at(const std::string& token) {
    return syntax::find_node_at(laid.root, static_cast<uint32_t>(laid.text.find(token)));
  }

  syntax::Layout<syntax::StmtPtr> laid;
};

TEST_F(LocateTest, OperatorTokenBelongsToBinary) {
  auto path = at("&&");

  ASSERT_TRUE(path);
  ASSERT_TRUE(std::holds_alternative<const syntax::Expr*>(path->back()));
  EXPECT_TRUE(syntax::as_logical_and(*std::get<const syntax::Expr*>(path->back())));
}

TEST_F(LocateTest, KeywordsBelongToTheirClauses) {
  auto when_path = at("when");
  ASSERT_TRUE(when_path);
  EXPECT_TRUE(std::holds_alternative<const syntax::WhenClause*>(when_path->back()));
  ASSERT_GE(when_path->size(), 2u);
  EXPECT_TRUE(std::holds_alternative<const syntax::CaseLabel*>((*when_path)[when_path->size() - 2]));

  auto case_path = at("case");
  ASSERT_TRUE(case_path);
  EXPECT_TRUE(std::holds_alternative<const syntax::CaseLabel*>(case_path->back()));
}

TEST_F(LocateTest, NamesAreLeaves) {
  auto path = at("P");

  ASSERT_TRUE(path);
  ASSERT_TRUE(std::holds_alternative<const syntax::Identifier*>(path->back()));
  EXPECT_EQ(std::get<const syntax::Identifier*>(path->back())->name, "P");
  EXPECT_TRUE(std::holds_alternative<const syntax::Stmt*>(path->front()));
}

TEST_F(LocateTest, OffsetOutsideRootIsNotFound) {
  EXPECT_FALSE(syntax::find_node_at(laid.root, static_cast<uint32_t>(laid.text.size())));
  EXPECT_FALSE(syntax::find_node_at(nullptr, 0));
}

TEST_F(LocateTest, ChildrenFollowSourceOrder) {
  const auto& stmt = std::get<syntax::SwitchStmt>(laid.root->value);
  const auto& label = stmt.sections[0].labels[0];

  auto children = syntax::children_of(&label);

  ASSERT_EQ(children.size(), 2u);
  EXPECT_LT(syntax::span_of(children[0]).start, syntax::span_of(children[1]).start);
  EXPECT_EQ(syntax::span_of(&label).start, static_cast<uint32_t>(laid.text.find("case")));
}

} // namespace
