#ifndef BIRCH_CODEC_H
#define BIRCH_CODEC_H

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include "slice.h"
#include "status.h"

namespace Birch {

/*
 * Byte encoding for keys and values. Each type stored in a table needs a specialization providing:
 *
 *     static auto type_name() -> std::string;
 *     static auto fixed_width() -> std::optional<Size>;
 *     static auto encode(const T &value) -> std::string;
 *     static auto decode(const Slice &in, T &out) -> Status;
 *
 * Key types must also provide a total order over encoded keys:
 *
 *     static auto compare(const Slice &lhs, const Slice &rhs) -> ThreeWayComparison;
 */
template<class T>
struct Codec;

template<>
struct Codec<std::string> {
    static auto type_name() -> std::string
    {
        return "string";
    }

    static auto fixed_width() -> std::optional<Size>
    {
        return std::nullopt;
    }

    static auto encode(const std::string &value) -> std::string
    {
        return value;
    }

    [[nodiscard]]
    static auto decode(const Slice &in, std::string &out) -> Status
    {
        out = in.to_string();
        return Status::ok();
    }

    static auto compare(const Slice &lhs, const Slice &rhs) -> ThreeWayComparison
    {
        return compare_three_way(lhs, rhs);
    }
};

/*
 * Little-endian encoding for integral types, ordered numerically.
 */
template<class T>
struct IntegerCodec {
    static_assert(std::is_integral_v<T>);
    using Unsigned = std::make_unsigned_t<T>;

    static auto fixed_width() -> std::optional<Size>
    {
        return sizeof(T);
    }

    static auto encode(const T &value) -> std::string
    {
        std::string out(sizeof(T), '\x00');
        auto bits = static_cast<std::uint64_t>(static_cast<Unsigned>(value));
        for (Size i {}; i < sizeof(T); ++i) {
            out[i] = static_cast<Byte>(bits & 0xFF);
            bits >>= 8;
        }
        return out;
    }

    [[nodiscard]]
    static auto decode(const Slice &in, T &out) -> Status
    {
        if (in.size() != sizeof(T))
            return Status::type_mismatch("stored value has the wrong width for an integer type");
        out = decode_unchecked(in);
        return Status::ok();
    }

    static auto compare(const Slice &lhs, const Slice &rhs) -> ThreeWayComparison
    {
        const auto a = decode_unchecked(lhs);
        const auto b = decode_unchecked(rhs);
        if (a < b)
            return ThreeWayComparison::LT;
        return a == b ? ThreeWayComparison::EQ : ThreeWayComparison::GT;
    }

private:
    static auto decode_unchecked(const Slice &in) -> T
    {
        std::uint64_t bits {};
        const auto n = in.size() < sizeof(T) ? in.size() : sizeof(T);
        for (Size i {}; i < n; ++i)
            bits |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(in[i])) << (8 * i);
        return static_cast<T>(static_cast<Unsigned>(bits));
    }
};

template<>
struct Codec<std::uint8_t>: IntegerCodec<std::uint8_t> {
    static auto type_name() -> std::string
    {
        return "u8";
    }
};

template<>
struct Codec<std::uint16_t>: IntegerCodec<std::uint16_t> {
    static auto type_name() -> std::string
    {
        return "u16";
    }
};

template<>
struct Codec<std::uint32_t>: IntegerCodec<std::uint32_t> {
    static auto type_name() -> std::string
    {
        return "u32";
    }
};

template<>
struct Codec<std::uint64_t>: IntegerCodec<std::uint64_t> {
    static auto type_name() -> std::string
    {
        return "u64";
    }
};

template<>
struct Codec<std::int32_t>: IntegerCodec<std::int32_t> {
    static auto type_name() -> std::string
    {
        return "i32";
    }
};

template<>
struct Codec<std::int64_t>: IntegerCodec<std::int64_t> {
    static auto type_name() -> std::string
    {
        return "i64";
    }
};

} // namespace Birch

#endif // BIRCH_CODEC_H
