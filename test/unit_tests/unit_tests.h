#ifndef BIRCH_TEST_UNIT_TESTS_H
#define BIRCH_TEST_UNIT_TESTS_H

#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>
#include "birch/birch.h"
#include "tools/harness.h"
#include "tools/random.h"

namespace Birch {

namespace internal {
    extern std::uint32_t random_seed;
} // namespace internal

static constexpr Size SMALL_PAGE_SIZE {MINIMUM_PAGE_SIZE};

// Fixed-width key that sorts the same way as "n".
[[nodiscard]]
inline auto make_key(Size n) -> std::string
{
    auto key = std::to_string(n);
    return std::string(8 - key.size(), '0') + key;
}

[[nodiscard]]
inline auto make_value(Size n, Size size = 10) -> std::string
{
    auto value = std::to_string(n);
    if (value.size() < size)
        value.append(size - value.size(), '*');
    return value;
}

// Drain a cursor-like object, collecting the keys it produces.
template<class Iter>
auto collect_keys(Iter &iter, bool reverse = false) -> std::vector<std::string>
{
    std::vector<std::string> keys;
    for (;;) {
        auto entry = reverse ? iter.next_back() : iter.next();
        if (!entry)
            break;
        keys.emplace_back(entry->first.bytes().to_string());
    }
    return keys;
}

} // namespace Birch

#endif // BIRCH_TEST_UNIT_TESTS_H
