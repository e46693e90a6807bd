#pragma once

#include "core/item.hpp"
#include <functional>
#include <string_view>
#include <vector>

namespace nom {

/**
 * Ordering - Chronological direction for item listings.
 */
enum class Ordering {
    Ascending,
    Descending
};

inline constexpr std::string_view ASCENDING_TOKEN = "asc";
inline constexpr std::string_view DESCENDING_TOKEN = "desc";
inline constexpr Ordering DEFAULT_ORDERING = Ordering::Ascending;

/**
 * Map an ordering token to an Ordering. "desc" selects descending; every
 * other value, including unrecognised ones, selects ascending.
 */
[[nodiscard]] Ordering parse_ordering(std::string_view token) noexcept;

[[nodiscard]] std::string_view to_token(Ordering ordering) noexcept;

using ItemComparator = std::function<bool(const Item&, const Item&)>;

/**
 * Strict weak ordering over items by published_at. Ties are broken by id
 * in the same direction as the primary key.
 */
[[nodiscard]] ItemComparator comparator_for(Ordering ordering);

/**
 * Sort items in place according to `ordering`.
 */
void sort_items(std::vector<Item>& items, Ordering ordering);

} // namespace nom
