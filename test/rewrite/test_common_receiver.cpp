#include <gtest/gtest.h>

#include "src/rewrite/common_receiver.hpp"
#include "test/rewrite/test_helpers/common.hpp"

namespace {

using namespace syntax::make;

class CommonReceiverTest : public test::helpers::RewriteTestBase {
protected:
  static std::vector<std::string> spelled(const std::vector<syntax::Identifier>& names) {
    std::vector<std::string> result;
    for (const auto& name : names) {
      result.push_back(name.name);
    }
    return result;
  }
};

TEST_F(CommonReceiverTest, SiblingMembers) {
  auto common = rewrite::resolve_common_receiver(path("a", {"b"}), path("a", {"c"}), model);

  ASSERT_TRUE(common);
  EXPECT_EQ(syntax::to_source(common->receiver), "a");
  EXPECT_EQ(spelled(common->left_names), (std::vector<std::string>{"b"}));
  EXPECT_EQ(spelled(common->right_names), (std::vector<std::string>{"c"}));
}

TEST_F(CommonReceiverTest, SharedPrefixIsTrimmed) {
  auto common = rewrite::resolve_common_receiver(path("a", {"b", "P", "c"}),
                                                 path("a", {"b", "P", "d"}), model);

  ASSERT_TRUE(common);
  EXPECT_EQ(syntax::to_source(common->receiver), "a.b.P");
  EXPECT_EQ(spelled(common->left_names), (std::vector<std::string>{"c"}));
  EXPECT_EQ(spelled(common->right_names), (std::vector<std::string>{"d"}));
}

TEST_F(CommonReceiverTest, TrimmingKeepsLastNameOfShorterChain) {
  auto common = rewrite::resolve_common_receiver(path("a", {"b"}), path("a", {"b", "c"}), model);

  ASSERT_TRUE(common);
  EXPECT_EQ(syntax::to_source(common->receiver), "a");
  EXPECT_EQ(spelled(common->left_names), (std::vector<std::string>{"b"}));
  EXPECT_EQ(spelled(common->right_names), (std::vector<std::string>{"b", "c"}));
}

TEST_F(CommonReceiverTest, SharedPrefixUnderDoubleConditionalAccess) {
  auto left = conditional(ident("a"), conditional(binding("b"), binding("c")));
  auto right = conditional(ident("a"), conditional(binding("b"), binding("d")));

  auto common = rewrite::resolve_common_receiver(left, right, model);

  ASSERT_TRUE(common);
  EXPECT_EQ(syntax::to_source(common->receiver), "a?.b");
  EXPECT_EQ(spelled(common->left_names), (std::vector<std::string>{"c"}));
}

TEST_F(CommonReceiverTest, ImplicitThisOnBothSides) {
  auto common = rewrite::resolve_common_receiver(ident("b"), ident("c"), model);

  ASSERT_TRUE(common);
  EXPECT_FALSE(common->receiver);
}

TEST_F(CommonReceiverTest, SharedImplicitThisPrefixBecomesMemberReceiver) {
  auto common = rewrite::resolve_common_receiver(member(ident("b"), "c"),
                                                 member(ident("b"), "d"), model);

  ASSERT_TRUE(common);
  EXPECT_EQ(syntax::to_source(common->receiver), "b");
}

TEST_F(CommonReceiverTest, ExplicitAndImplicitThisDiffer) {
  EXPECT_FALSE(rewrite::resolve_common_receiver(member(this_expr(), "b"), ident("c"), model));
}

TEST_F(CommonReceiverTest, SideWithoutNamesFails) {
  EXPECT_FALSE(rewrite::resolve_common_receiver(ident("a"), path("a", {"b"}), model));
  EXPECT_FALSE(rewrite::resolve_common_receiver(path("a", {"b"}), call(ident("F")), model));
}

TEST_F(CommonReceiverTest, DifferentBaseReceiversFail) {
  EXPECT_FALSE(rewrite::resolve_common_receiver(path("a", {"b"}), path("x", {"b"}), model));
}

} // namespace
