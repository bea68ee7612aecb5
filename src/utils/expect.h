#ifndef BIRCH_UTILS_EXPECT_H
#define BIRCH_UTILS_EXPECT_H

#include <cstdio>
#include <cstdlib>
#include <tl/expected.hpp>
#include "birch/status.h"

#ifdef NDEBUG
#  define BIRCH_EXPECT_(expr, file, line)
#else
#  define BIRCH_EXPECT_(expr, file, line) Impl::expect(expr, #expr, file, line)
#endif // NDEBUG

#define BIRCH_EXPECT_TRUE(expr) BIRCH_EXPECT_(expr, __FILE__, __LINE__)
#define BIRCH_EXPECT_FALSE(expr) BIRCH_EXPECT_TRUE(!(expr))
#define BIRCH_EXPECT_EQ(lhs, rhs) BIRCH_EXPECT_TRUE((lhs) == (rhs))
#define BIRCH_EXPECT_NE(lhs, rhs) BIRCH_EXPECT_TRUE((lhs) != (rhs))
#define BIRCH_EXPECT_LT(lhs, rhs) BIRCH_EXPECT_TRUE((lhs) < (rhs))
#define BIRCH_EXPECT_LE(lhs, rhs) BIRCH_EXPECT_TRUE((lhs) <= (rhs))
#define BIRCH_EXPECT_GT(lhs, rhs) BIRCH_EXPECT_TRUE((lhs) > (rhs))
#define BIRCH_EXPECT_GE(lhs, rhs) BIRCH_EXPECT_TRUE((lhs) >= (rhs))

#define BIRCH_TRY_S(expr) \
    do { \
        if (auto birch_try_status = (expr); !birch_try_status.is_ok()) \
            return birch_try_status; \
    } while (0)

#define BIRCH_TRY_R(expr) \
    do { \
        if (auto birch_try_result = (expr); !birch_try_result.has_value()) \
            return tl::make_unexpected(birch_try_result.error()); \
    } while (0)

#define BIRCH_NEW_R(out, expr) \
    auto birch_try_##out = (expr); \
    if (!birch_try_##out.has_value()) { \
        return tl::make_unexpected(birch_try_##out.error()); \
    } \
    auto out = std::move(*birch_try_##out)

namespace Birch::Impl {

inline constexpr auto expect(bool cond, const char *repr, const char *file, int line) noexcept -> void
{
    if (!cond) {
        std::fprintf(stderr, "expectation (%s) failed at %s:%d\n", repr, file, line);
        std::abort();
    }
}

} // namespace Birch::Impl

#endif // BIRCH_UTILS_EXPECT_H
