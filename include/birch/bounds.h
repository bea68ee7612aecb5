#ifndef BIRCH_BOUNDS_H
#define BIRCH_BOUNDS_H

#include <string>
#include "codec.h"

namespace Birch {

struct ByteBound {
    enum class Kind {
        UNBOUNDED,
        INCLUDED,
        EXCLUDED,
    };

    Kind kind {Kind::UNBOUNDED};
    std::string key;
};

struct ByteRange {
    ByteBound lower;
    ByteBound upper;
};

/*
 * Typed range over the keys of a table. Endpoints are interpreted under the key type's comparator,
 * so a reversed ordering takes bounds in reversed order as well.
 */
template<class K>
class KeyRange final {
public:
    [[nodiscard]]
    static auto all() -> KeyRange
    {
        return KeyRange {};
    }

    // [lower, upper]
    [[nodiscard]]
    static auto closed(const K &lower, const K &upper) -> KeyRange
    {
        return KeyRange {included(lower), included(upper)};
    }

    // [lower, upper)
    [[nodiscard]]
    static auto half_open(const K &lower, const K &upper) -> KeyRange
    {
        return KeyRange {included(lower), excluded(upper)};
    }

    [[nodiscard]]
    static auto at_least(const K &lower) -> KeyRange
    {
        return KeyRange {included(lower), ByteBound {}};
    }

    [[nodiscard]]
    static auto greater_than(const K &lower) -> KeyRange
    {
        return KeyRange {excluded(lower), ByteBound {}};
    }

    [[nodiscard]]
    static auto at_most(const K &upper) -> KeyRange
    {
        return KeyRange {ByteBound {}, included(upper)};
    }

    [[nodiscard]]
    static auto less_than(const K &upper) -> KeyRange
    {
        return KeyRange {ByteBound {}, excluded(upper)};
    }

    [[nodiscard]]
    auto bytes() const -> const ByteRange &
    {
        return m_range;
    }

private:
    KeyRange() = default;

    KeyRange(ByteBound lower, ByteBound upper)
        : m_range {std::move(lower), std::move(upper)}
    {}

    static auto included(const K &key) -> ByteBound
    {
        return ByteBound {ByteBound::Kind::INCLUDED, Codec<K>::encode(key)};
    }

    static auto excluded(const K &key) -> ByteBound
    {
        return ByteBound {ByteBound::Kind::EXCLUDED, Codec<K>::encode(key)};
    }

    ByteRange m_range;
};

} // namespace Birch

#endif // BIRCH_BOUNDS_H
