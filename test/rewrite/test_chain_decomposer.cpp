#include <gtest/gtest.h>

#include "src/rewrite/chain_decomposer.hpp"
#include "src/syntax/equivalence.hpp"
#include "src/utils/error.hpp"
#include "test/rewrite/test_helpers/common.hpp"

namespace {

using namespace syntax::make;

class ChainDecomposerTest : public test::helpers::RewriteTestBase {
protected:
  static std::vector<std::string> names_of(const rewrite::ChainDecomposition& chain) {
    std::vector<std::string> names;
    for (const auto& name : chain.root_to_leaf()) {
      names.push_back(name.name.name);
    }
    return names;
  }
};

TEST_F(ChainDecomposerTest, MemberAccessChain) {
  auto chain = rewrite::decompose_chain(path("a", {"b", "c"}), model);

  ASSERT_TRUE(chain.receiver);
  EXPECT_EQ(syntax::to_source(chain.receiver), "a");
  EXPECT_EQ(names_of(chain), (std::vector<std::string>{"b", "c"}));
  EXPECT_EQ(chain.names.front().name.name, "c");
}

TEST_F(ChainDecomposerTest, ImplicitThisHasNoReceiver) {
  auto chain = rewrite::decompose_chain(member(ident("b"), "c"), model);

  EXPECT_FALSE(chain.receiver);
  EXPECT_EQ(names_of(chain), (std::vector<std::string>{"b", "c"}));
  EXPECT_FALSE(chain.root_to_leaf().front().owner_receiver);
}

TEST_F(ChainDecomposerTest, StopsAtNonConvertibleName) {
  auto expr = path("a", {"b", "Count", "c"});

  auto chain = rewrite::decompose_chain(expr, model);

  EXPECT_EQ(syntax::to_source(chain.receiver), "a.b.Count");
  EXPECT_EQ(names_of(chain), (std::vector<std::string>{"c"}));
}

TEST_F(ChainDecomposerTest, NonChainExpressionIsItsOwnReceiver) {
  auto expr = call(ident("Make"));

  auto chain = rewrite::decompose_chain(expr, model);

  EXPECT_EQ(chain.receiver, expr);
  EXPECT_TRUE(chain.empty());
}

TEST_F(ChainDecomposerTest, ConditionalAccessFoldsIntoNames) {
  auto chain = rewrite::decompose_chain(
      conditional(ident("a"), member(binding("b"), "c")), model);

  EXPECT_EQ(syntax::to_source(chain.receiver), "a");
  EXPECT_EQ(names_of(chain), (std::vector<std::string>{"b", "c"}));
}

TEST_F(ChainDecomposerTest, NestedConditionalAccess) {
  auto expr = conditional(ident("a"), conditional(binding("b"), binding("c")));

  auto chain = rewrite::decompose_chain(expr, model);

  EXPECT_EQ(syntax::to_source(chain.receiver), "a");
  EXPECT_EQ(names_of(chain), (std::vector<std::string>{"b", "c"}));
}

TEST_F(ChainDecomposerTest, ConditionalAccessStoppingEarlyKeepsNullCheck) {
  auto expr = conditional(ident("a"), member(call(binding("M")), "b"));

  auto chain = rewrite::decompose_chain(expr, model);

  EXPECT_EQ(syntax::to_source(chain.receiver), "a?.M()");
  EXPECT_EQ(names_of(chain), (std::vector<std::string>{"b"}));
}

TEST_F(ChainDecomposerTest, UnconvertibleBindingReturnsWholeAccess) {
  auto expr = conditional(ident("a"), binding("Count"));

  auto chain = rewrite::decompose_chain(expr, model);

  EXPECT_EQ(chain.receiver, expr);
  EXPECT_TRUE(chain.empty());
}

TEST_F(ChainDecomposerTest, DecomposingReceiverAgainFindsNothing) {
  for (const auto& expr : {path("a", {"b", "c"}),
                           conditional(ident("a"), member(call(binding("M")), "b")),
                           path("a", {"b", "Count", "c"})}) {
    auto first = rewrite::decompose_chain(expr, model);
    ASSERT_TRUE(first.receiver);
    auto second = rewrite::decompose_chain(first.receiver, model);
    EXPECT_TRUE(second.empty()) << syntax::to_source(expr);
    EXPECT_TRUE(syntax::are_equivalent(second.receiver, first.receiver));
  }
}

TEST_F(ChainDecomposerTest, RebuiltChainDecomposesToSameNames) {
  auto first = rewrite::decompose_chain(path("a", {"b", "P", "c"}), model);

  auto rebuilt = first.receiver;
  for (const auto& name : first.root_to_leaf()) {
    rebuilt = member(rebuilt, name.name.name);
  }
  auto second = rewrite::decompose_chain(rebuilt, model);

  EXPECT_EQ(names_of(second), names_of(first));
  EXPECT_TRUE(syntax::are_equivalent(second.receiver, first.receiver));
}

TEST_F(ChainDecomposerTest, OwnersRebuildIntermediateReceivers) {
  auto expr = path("a", {"b", "c"});

  auto chain = rewrite::decompose_chain(expr, model);

  ASSERT_EQ(chain.names.size(), 2u);
  EXPECT_EQ(chain.names[0].owner, expr.get());
  EXPECT_EQ(syntax::to_source(chain.names[0].owner_receiver), "a.b");
  EXPECT_EQ(syntax::to_source(chain.names[1].owner_receiver), "a");
}

TEST_F(ChainDecomposerTest, MemberBindingOutsideConditionalAccessIsRejected) {
  EXPECT_THROW(rewrite::decompose_chain(binding("b"), model), InternalError);
}

TEST_F(ChainDecomposerTest, NullableWrapperMemberIsNotConvertible) {
  model.declare("HasValue", semantic::SymbolInfo{
                                .kind = semantic::SymbolKind::PROPERTY,
                                .containing_type_is_nullable_wrapper = true});

  auto chain = rewrite::decompose_chain(path("a", {"HasValue"}), model);

  EXPECT_TRUE(chain.empty());
}

TEST_F(ChainDecomposerTest, NonMemberOnNullableWrapperIsInconsistent) {
  model.declare("odd", semantic::SymbolInfo{
                           .kind = semantic::SymbolKind::METHOD,
                           .containing_type_is_nullable_wrapper = true});

  EXPECT_THROW(rewrite::decompose_chain(path("odd", {"b"}), model),
               semantic::OracleInconsistency);
}

} // namespace
