#include "core/types.hpp"

#include <type_traits>

namespace tally {

static_assert(sizeof(Uuid) == Uuid::BYTE_SIZE, "Uuid must stay 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid is passed through Qt signals by value");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp is stored as a plain int64");

} // namespace tally
