#include <gtest/gtest.h>

#include "src/utils/debug_context.hpp"
#include "src/utils/error.hpp"

#include <optional>
#include <thread>

namespace {

TEST(DebugContextTest, FormatsNestedStages) {
  auto outer = debug::push("rewrite", "logical-and");
  auto inner = debug::push("merge", "");

  EXPECT_EQ(debug::Context::instance().depth(), 2u);
  EXPECT_EQ(debug::format_with_context("boom"), "In rewrite 'logical-and' -> merge: boom");
  EXPECT_TRUE(debug::Context::instance().in_stage("merge"));
}

TEST(DebugContextTest, GuardsPopOnScopeExit) {
  {
    auto guard = debug::push("rewrite", "case-label");
    EXPECT_EQ(debug::Context::instance().depth(), 1u);
  }
  EXPECT_EQ(debug::Context::instance().depth(), 0u);
  EXPECT_EQ(debug::format_with_context("plain"), "plain");
}

TEST(DebugContextTest, MovedGuardKeepsEntryAlive) {
  std::optional<debug::Context::Guard> held;
  {
    auto guard = debug::push("rewrite", "switch-arm");
    held.emplace(std::move(guard));
  }
  EXPECT_EQ(debug::Context::instance().depth(), 1u);
  held.reset();
  EXPECT_EQ(debug::Context::instance().depth(), 0u);
}

TEST(DebugContextTest, ErrorsCarryContextAndSpan) {
  auto guard = debug::push("merge", "subpattern");
  try {
    error_helper::invariant_violation("lost designation", span::Span{0, 4, 9});
    FAIL() << "expected InternalError";
  } catch (const InternalError& error) {
    EXPECT_EQ(std::string(error.what()),
              "In merge 'subpattern': lost designation - invariant violation");
    EXPECT_EQ(error.span(), (span::Span{0, 4, 9}));
  }
}

TEST(DebugContextTest, EntriesAreThreadLocal) {
  auto guard = debug::push("rewrite", "logical-and");
  std::size_t other_depth = 99;
  std::thread worker([&] { other_depth = debug::Context::instance().depth(); });
  worker.join();

  EXPECT_EQ(other_depth, 0u);
}

} // namespace
