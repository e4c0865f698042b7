#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>

namespace arcspin {
namespace base {

using ObjectId = uint64_t;

static constexpr ObjectId NoObjectId = std::numeric_limits<ObjectId>::max();

} // namespace base
} // namespace arcspin
