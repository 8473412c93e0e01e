#include "engine/category_expander.hpp"

#include <algorithm>
#include <utility>

#include "common/errors.hpp"

namespace focusguard {

namespace {

struct CategoryEntry {
    const char *id;
    std::vector<const char *> domains;
};

const std::vector<CategoryEntry> &categoryTable()
{
    static const std::vector<CategoryEntry> table = {
        {"social_media", {"facebook.com", "twitter.com", "instagram.com",
                          "tiktok.com", "linkedin.com"}},
        {"news", {"cnn.com", "bbc.com", "nytimes.com", "reddit.com"}},
        {"entertainment", {"youtube.com", "netflix.com", "twitch.tv"}},
        {"shopping", {"amazon.com", "ebay.com"}},
        {"gaming", {"steam.com", "epicgames.com"}},
        {"adult", {}},
    };
    return table;
}

const CategoryEntry *findEntry(const std::string &id)
{
    const auto &table = categoryTable();
    auto it = std::find_if(table.begin(), table.end(), [&id](const CategoryEntry &entry) {
        return id == entry.id;
    });
    return it == table.end() ? nullptr : &*it;
}

} // namespace

std::vector<std::string> CategoryExpander::knownCategories()
{
    std::vector<std::string> ids;
    for (const auto &entry : categoryTable()) {
        ids.emplace_back(entry.id);
    }
    return ids;
}

bool CategoryExpander::isKnown(const CategoryId &category)
{
    return findEntry(category.value()) != nullptr;
}

std::set<BlockTarget> CategoryExpander::expand(const std::vector<CategoryId> &categories)
{
    std::set<BlockTarget> targets;
    for (const auto &category : categories) {
        const CategoryEntry *entry = findEntry(category.value());
        if (!entry) {
            throw BlockingError::validation("categories",
                                            "Unknown category: " + category.value());
        }
        for (const char *domain : entry->domains) {
            targets.insert(Domain(domain));
        }
    }
    return targets;
}

std::set<BlockTarget> CategoryExpander::expand(const std::vector<std::string> &categories)
{
    std::vector<CategoryId> ids;
    ids.reserve(categories.size());
    for (const auto &raw : categories) {
        if (!findEntry(raw)) {
            throw BlockingError::validation("categories", "Unknown category: " + raw);
        }
        ids.emplace_back(raw);
    }
    return expand(ids);
}

} // namespace focusguard
