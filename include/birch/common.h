#ifndef BIRCH_COMMON_H
#define BIRCH_COMMON_H

#include <cstdint>

namespace Birch {

// Common types.
using Byte = char;
using Size = std::uint64_t;

} // namespace Birch

#endif // BIRCH_COMMON_H
