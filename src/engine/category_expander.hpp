#pragma once

#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace focusguard {

// Static category table. Categories resolve to concrete block targets.
class CategoryExpander {
public:
    static std::vector<std::string> knownCategories();
    static bool isKnown(const CategoryId &category);

    // Union of the targets of every category. Throws a validation error naming
    // the first unknown id.
    static std::set<BlockTarget> expand(const std::vector<CategoryId> &categories);
    static std::set<BlockTarget> expand(const std::vector<std::string> &categories);
};

} // namespace focusguard
