//! # Mismatch Reporter Implementation

#include "diag/reporter.hpp"

#include <algorithm>
#include <unordered_map>

namespace tyfix::diag {

auto Reporter::conflicting_names(const std::vector<types::TypePtr>& types)
    -> std::vector<types::ItemId> {
    std::vector<types::ItemId> items;
    for (const auto& type : types) {
        types::collect_items(type, items);
    }

    // Distinct identities per short name.
    std::unordered_map<std::string, std::vector<types::ItemId>> by_name;
    for (auto& item : items) {
        auto& bucket = by_name[item.name];
        if (std::find(bucket.begin(), bucket.end(), item) == bucket.end()) {
            bucket.push_back(std::move(item));
        }
    }

    std::vector<types::ItemId> conflicting;
    for (auto& [name, bucket] : by_name) {
        if (bucket.size() > 1) {
            for (auto& item : bucket) {
                conflicting.push_back(std::move(item));
            }
        }
    }
    return conflicting;
}

auto Reporter::expected_found(const types::TypePtr& expected, const types::TypePtr& actual)
    -> std::string {
    types::TypeRenderer renderer(conflicting_names({expected, actual}));
    return "expected `" + renderer.render(expected) + "`, found `" + renderer.render(actual) +
           "`";
}

auto Reporter::render(const types::TypePtr& type) -> std::string {
    return types::TypeRenderer(conflicting_names({type})).render(type);
}

} // namespace tyfix::diag
