//! # Deref/Ref Path Finder Implementation

#include "coerce/path_finder.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace tyfix::coerce {

namespace {

/// One peeled layer of the expected type.
struct PeeledType {
    types::TypePtr type;
    size_t depth; ///< Reference layers removed to reach `type`
};

/// Every reference in `seq[0..=last]` is `&mut`.
auto all_refs_mutable(const std::vector<types::TypePtr>& seq, size_t last) -> bool {
    for (size_t i = 0; i <= last && i < seq.size(); ++i) {
        const auto& step = seq[i];
        if (step->is<types::RefType>() && !types::is_mut(step->as<types::RefType>().mutability)) {
            return false;
        }
    }
    return true;
}

} // namespace

auto find_deref_ref_path(const types::TypePtr& expected, const types::TypePtr& actual,
                         const syntax::ExprHandle& expr, traits::TraitOracle& oracle)
    -> std::optional<DerefRefPath> {
    std::vector<types::Mutability> expected_refs;
    std::vector<PeeledType> peeled{{expected, 0}};

    auto current = expected;
    while (current->is<types::RefType>()) {
        const auto& ref = current->as<types::RefType>();
        expected_refs.push_back(ref.mutability);
        current = ref.inner;
        peeled.push_back({current, expected_refs.size()});
    }

    auto actual_seq = oracle.coercion_sequence(actual);

    std::optional<std::pair<size_t, size_t>> found; // (derefs, ref_count)
    for (size_t i = 0; i < actual_seq.size() && !found; ++i) {
        for (const auto& layer : peeled) {
            if (types::types_equal(actual_seq[i], layer.type)) {
                found = std::make_pair(i, layer.depth);
                break;
            }
        }
    }

    if (!found) {
        TYFIX_LOG_TRACE("coerce", "no deref/ref path from `" << types::type_to_string(actual)
                                                              << "` to `"
                                                              << types::type_to_string(expected)
                                                              << "`");
        return std::nullopt;
    }

    auto [derefs, ref_count] = *found;
    DerefRefPath path{derefs, std::vector<types::Mutability>(expected_refs.begin(),
                                                             expected_refs.begin() + ref_count)};

    bool needs_mut = std::any_of(path.refs.begin(), path.refs.end(), types::is_mut);
    if (needs_mut && !(expr.is_mutable_place() && all_refs_mutable(actual_seq, derefs))) {
        TYFIX_LOG_DEBUG("coerce", "path to `" << types::type_to_string(expected)
                                              << "` needs a mutable borrow of `" << expr.text()
                                              << "`, which is not a mutable place");
        return std::nullopt;
    }

    TYFIX_LOG_TRACE("coerce", "path found: derefs=" << path.derefs
                                                    << " refs=" << path.refs.size());
    return path;
}

auto apply_deref_ref_path(const std::vector<types::TypePtr>& actual_seq, const DerefRefPath& path)
    -> types::TypePtr {
    if (path.derefs >= actual_seq.size()) {
        return nullptr;
    }
    auto result = actual_seq[path.derefs];
    for (auto it = path.refs.rbegin(); it != path.refs.rend(); ++it) {
        result = types::make_ref(result, *it);
    }
    return result;
}

auto render_deref_ref_path(const DerefRefPath& path, const std::string& expr_text)
    -> std::string {
    std::string out;
    for (auto mutability : path.refs) {
        out += types::is_mut(mutability) ? "&mut " : "&";
    }
    out.append(path.derefs, '*');
    out += expr_text;
    return out;
}

} // namespace tyfix::coerce
