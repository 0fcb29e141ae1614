#pragma once

#include "gtest/gtest.h"
#include "src/rewrite/recursive_patterns.hpp"
#include "src/semantic/declared_model.hpp"
#include "src/syntax/factory.hpp"
#include "src/syntax/pretty_print/pretty_print.hpp"
#include <optional>
#include <string>

namespace test::helpers {

/**
 * @brief Base class for rewrite tests
 *
 * Owns a semantic model in which `a`, `e`, `o`, `x`, `n`, `item`, `v` and
 * `rest` are locals, the lower-case single letters `b`, `c`, `d` and the
 * capitalized names are instance properties or fields, `Count` is static and
 * `Max` is a named constant.
 */
class RewriteTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* local : {"a", "e", "o", "x", "n", "item", "v", "rest"}) {
            model.declare_local(local);
        }
        for (const char* property : {"b", "c", "d", "P", "Q", "Flag", "Name", "Length"}) {
            model.declare_property(property);
        }
        model.declare_field("A").declare_field("B");
        model.declare_static_property("Count");
        model.declare_constant("Max", semantic::IntConst{10});
    }

    /**
     * @brief Print `stmt`, put an empty selection on `token` and run the rewrite
     *
     * @param occurrence which occurrence of `token` to select, counting from 0
     * @return the rewritten source, or nullopt when no rewrite is offered
     */
    std::optional<std::string> rewrite_at(const syntax::StmtPtr& stmt,
                                          const std::string& token,
                                          size_t occurrence = 0) {
        auto laid = syntax::layout(stmt);
        auto pos = offset_of(laid.text, token, occurrence);
        if (pos == std::string::npos) {
            ADD_FAILURE() << "token '" << token << "' not found in: " << laid.text;
            return std::nullopt;
        }
        auto rewrite = rewrite::try_build_rewrite(
            laid.root, span::Span::at(static_cast<uint32_t>(pos)), model);
        if (!rewrite) {
            return std::nullopt;
        }
        return syntax::to_source((*rewrite)(laid.root));
    }

    static size_t offset_of(const std::string& text, const std::string& token,
                            size_t occurrence) {
        auto pos = text.find(token);
        while (pos != std::string::npos && occurrence > 0) {
            pos = text.find(token, pos + 1);
            --occurrence;
        }
        return pos;
    }

    semantic::DeclaredSemanticModel model;
};

} // namespace test::helpers
