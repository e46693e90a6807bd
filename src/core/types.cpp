#include "core/types.hpp"

#include <type_traits>

// Timestamp is header-only; this translation unit pins its layout.

namespace nom {

static_assert(sizeof(Timestamp) == sizeof(int64_t), "Timestamp should wrap a single int64");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(Timestamp{}.is_zero(), "Default Timestamp should be the unset value");

} // namespace nom
