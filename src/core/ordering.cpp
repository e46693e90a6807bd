#include "core/ordering.hpp"

#include <algorithm>

namespace nom {

Ordering parse_ordering(std::string_view token) noexcept {
    if (token == DESCENDING_TOKEN) {
        return Ordering::Descending;
    }
    return Ordering::Ascending;
}

std::string_view to_token(Ordering ordering) noexcept {
    return ordering == Ordering::Descending ? DESCENDING_TOKEN : ASCENDING_TOKEN;
}

ItemComparator comparator_for(Ordering ordering) {
    if (ordering == Ordering::Descending) {
        return [](const Item& a, const Item& b) {
            if (a.published_at != b.published_at) {
                return a.published_at > b.published_at;
            }
            return a.id > b.id;
        };
    }
    return [](const Item& a, const Item& b) {
        if (a.published_at != b.published_at) {
            return a.published_at < b.published_at;
        }
        return a.id < b.id;
    };
}

void sort_items(std::vector<Item>& items, Ordering ordering) {
    std::sort(items.begin(), items.end(), comparator_for(ordering));
}

} // namespace nom
