#include "common_receiver.hpp"

#include "rewrite/chain_decomposer.hpp"
#include "syntax/editor.hpp"
#include "syntax/equivalence.hpp"
#include "utils/error.hpp"

namespace rewrite {

namespace {

std::vector<syntax::Identifier> names_from(const std::vector<ChainName>& chain,
                                           size_t first) {
    std::vector<syntax::Identifier> names;
    for (size_t i = first; i < chain.size(); ++i) {
        names.push_back(chain[i].name);
    }
    return names;
}

} // namespace

std::optional<CommonReceiver> resolve_common_receiver(const syntax::ExprPtr& left,
                                                      const syntax::ExprPtr& right,
                                                      const semantic::SemanticModel& model) {
    auto left_chain = decompose_chain(left, model);
    auto right_chain = decompose_chain(right, model);
    if (left_chain.empty() || right_chain.empty()) {
        return std::nullopt;
    }
    if (!syntax::are_equivalent(left_chain.receiver, right_chain.receiver)) {
        return std::nullopt;
    }

    auto left_names = left_chain.root_to_leaf();
    auto right_names = right_chain.root_to_leaf();
    size_t shared = 0;
    while (shared + 1 < left_names.size() && shared + 1 < right_names.size() &&
           syntax::are_equivalent(left_names[shared].name, right_names[shared].name)) {
        ++shared;
    }

    CommonReceiver result;
    result.receiver = left_chain.receiver;
    if (shared > 0) {
        // Cutting the chain at its first unshared name leaves `receiver.shared...`.
        const auto& cut = left_names[shared];
        if (!cut.owner || !cut.owner_receiver) {
            error_helper::invariant_violation("shared chain prefix without a receiver",
                                              left->span);
        }
        syntax::SyntaxEditor editor;
        editor.replace(*cut.owner, cut.owner_receiver);
        result.receiver = editor.apply(left);
    }
    result.left_names = names_from(left_names, shared);
    result.right_names = names_from(right_names, shared);
    return result;
}

} // namespace rewrite
