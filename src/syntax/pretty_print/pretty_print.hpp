#pragma once

#include <string>

#include "../syntax.hpp"

namespace syntax {

// A printed tree: `root` is a copy of the input whose spans are offsets into
// `text`. Subtrees are re-created, so pointer identity with the input is lost.
template <typename NodePtr>
struct Layout {
    NodePtr root;
    std::string text;
};

Layout<StmtPtr> layout(const StmtPtr& root, span::FileId file = 0);
Layout<ExprPtr> layout(const ExprPtr& root, span::FileId file = 0);
Layout<PatternPtr> layout(const PatternPtr& root, span::FileId file = 0);

std::string to_source(const StmtPtr& stmt);
std::string to_source(const ExprPtr& expr);
std::string to_source(const PatternPtr& pattern);
std::string to_source(const Designation& designation);

const char* to_string(Binary::Op op);
const char* to_string(RelationalPattern::Op op);

} // namespace syntax
