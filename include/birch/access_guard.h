#ifndef BIRCH_ACCESS_GUARD_H
#define BIRCH_ACCESS_GUARD_H

#include <string>
#include <variant>
#include "codec.h"
#include "page_store.h"

namespace Birch {

/*
 * Bytes that either borrow a region of a page or are owned outright. A borrowing guard keeps its
 * page alive, but is only meaningful while the table that handed it out is open.
 */
class ByteGuard final {
public:
    [[nodiscard]]
    static auto borrowed(PageRef page, Size offset, Size size) -> ByteGuard
    {
        return ByteGuard {Borrowed {std::move(page), offset, size}};
    }

    [[nodiscard]]
    static auto owned(std::string data) -> ByteGuard
    {
        return ByteGuard {std::move(data)};
    }

    [[nodiscard]]
    auto is_owned() const -> bool
    {
        return std::holds_alternative<std::string>(m_data);
    }

    [[nodiscard]]
    auto bytes() const -> Slice
    {
        if (const auto *b = std::get_if<Borrowed>(&m_data))
            return b->page->data().range(b->offset, b->size);
        return Slice {std::get<std::string>(m_data)};
    }

private:
    struct Borrowed {
        PageRef page;
        Size offset {};
        Size size {};
    };

    explicit ByteGuard(Borrowed borrowed)
        : m_data {std::move(borrowed)}
    {}

    explicit ByteGuard(std::string owned)
        : m_data {std::move(owned)}
    {}

    std::variant<Borrowed, std::string> m_data;
};

/*
 * Typed handle to a key or value. Decoding happens on demand.
 */
template<class T>
class AccessGuard final {
public:
    explicit AccessGuard(ByteGuard bytes)
        : m_bytes {std::move(bytes)}
    {}

    [[nodiscard]]
    auto value(T &out) const -> Status
    {
        return Codec<T>::decode(m_bytes.bytes(), out);
    }

    [[nodiscard]]
    auto bytes() const -> Slice
    {
        return m_bytes.bytes();
    }

    [[nodiscard]]
    auto is_owned() const -> bool
    {
        return m_bytes.is_owned();
    }

private:
    ByteGuard m_bytes;
};

/*
 * Writable region reserved inside a page by insert_reserve(). Must be filled in before the table
 * is mutated again, and before the table is closed. Closing records the page checksum, so bytes
 * written afterward are reported as corruption once committed.
 */
class AccessGuardMut final {
public:
    AccessGuardMut() = default;

    AccessGuardMut(PageMut page, Size offset, Size size)
        : m_page {std::move(page)},
          m_offset {offset},
          m_size {size}
    {}

    [[nodiscard]]
    auto data() -> Span
    {
        return m_page ? m_page->span().range(m_offset, m_size) : Span {};
    }

    [[nodiscard]]
    auto size() const -> Size
    {
        return m_size;
    }

private:
    PageMut m_page;
    Size m_offset {};
    Size m_size {};
};

} // namespace Birch

#endif // BIRCH_ACCESS_GUARD_H
