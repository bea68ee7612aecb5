#ifndef BIRCH_TEST_TOOLS_RANDOM_H
#define BIRCH_TEST_TOOLS_RANDOM_H

#include <algorithm>
#include <random>
#include <string>
#include <type_traits>
#include "birch/common.h"

namespace Birch {

class Random final {
public:
    explicit Random(std::uint32_t seed = 0)
        : m_rng {seed}
    {}

    template<class T1, class T2>
    auto get(const T1 &lower, const T2 &upper) -> std::common_type_t<T1, T2>
    {
        using Result = std::common_type_t<T1, T2>;
        static_assert(std::is_integral_v<Result>);
        std::uniform_int_distribution<Result> distribution {Result(lower), Result(upper)};
        return distribution(m_rng);
    }

    template<class T>
    auto get(const T &upper) -> T
    {
        return get(T {}, upper);
    }

    auto next_string(Size size) -> std::string
    {
        static constexpr char chars[] {"ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                       "abcdefghijklmnopqrstuvwxyz"
                                       "0123456789"};
        std::string result(size, '\x00');
        // Skip the null terminator.
        std::generate_n(result.begin(), size, [this] {
            return chars[get(sizeof(chars) - 2)];
        });
        return result;
    }

    template<class Container>
    auto shuffle(Container &container) -> void
    {
        std::shuffle(std::begin(container), std::end(container), m_rng);
    }

private:
    std::default_random_engine m_rng;
};

} // namespace Birch

#endif // BIRCH_TEST_TOOLS_RANDOM_H
