#ifndef BIRCH_PAGE_STORE_H
#define BIRCH_PAGE_STORE_H

#include <cstdint>
#include <memory>
#include "slice.h"
#include "status.h"

namespace Birch {

struct PageNumber {
    [[nodiscard]]
    static constexpr auto null() noexcept -> PageNumber
    {
        return PageNumber {};
    }

    [[nodiscard]]
    constexpr auto is_null() const noexcept -> bool
    {
        return value == 0;
    }

    std::uint64_t value {};
};

inline constexpr auto operator==(const PageNumber &lhs, const PageNumber &rhs) noexcept -> bool
{
    return lhs.value == rhs.value;
}

inline constexpr auto operator!=(const PageNumber &lhs, const PageNumber &rhs) noexcept -> bool
{
    return lhs.value != rhs.value;
}

inline constexpr auto operator<(const PageNumber &lhs, const PageNumber &rhs) noexcept -> bool
{
    return lhs.value < rhs.value;
}

using Checksum = std::uint32_t;

/*
 * Handle to a snapshot of a tree: the root page and the checksum of its contents.
 */
struct RootPointer {
    PageNumber page;
    Checksum checksum {};
};

inline constexpr auto operator==(const RootPointer &lhs, const RootPointer &rhs) noexcept -> bool
{
    return lhs.page == rhs.page && lhs.checksum == rhs.checksum;
}

enum class PageHint {
    NONE,
    CLEAN,
};

class Page final {
public:
    Page(PageNumber id, Size size)
        : m_data {std::make_unique<Byte[]>(size)},
          m_size {size},
          m_id {id}
    {}

    [[nodiscard]]
    auto id() const -> PageNumber
    {
        return m_id;
    }

    [[nodiscard]]
    auto size() const -> Size
    {
        return m_size;
    }

    [[nodiscard]]
    auto data() const -> Slice
    {
        return Slice {m_data.get(), m_size};
    }

    [[nodiscard]]
    auto span() -> Span
    {
        return Span {m_data.get(), m_size};
    }

private:
    std::unique_ptr<Byte[]> m_data;
    Size m_size {};
    PageNumber m_id;
};

using PageRef = std::shared_ptr<const Page>;
using PageMut = std::shared_ptr<Page>;

/*
 * Fixed-size block storage. Pages allocated since the last commit are "uncommitted": they can be
 * written and released immediately. Committed pages are immutable, and are only released once
 * they have been marked freed, a commit has published the mark, and no reader can reach them.
 */
class PageStore {
public:
    virtual ~PageStore() = default;
    [[nodiscard]] virtual auto page_size() const -> Size = 0;
    [[nodiscard]] virtual auto allocate_page(PageMut &out) -> Status = 0;
    [[nodiscard]] virtual auto read_page(PageNumber id, PageHint hint, PageRef &out) -> Status = 0;
    [[nodiscard]] virtual auto write_page(PageNumber id, PageMut &out) -> Status = 0;
    [[nodiscard]] virtual auto is_uncommitted(PageNumber id) const -> bool = 0;
    virtual auto free_page(PageNumber id) -> void = 0;
    virtual auto mark_freed(PageNumber id) -> void = 0;
    [[nodiscard]] virtual auto commit(Size &version) -> Status = 0;
    virtual auto rollback() -> void = 0;
    virtual auto reclaim(Size oldest_live_version) -> Size = 0;
    [[nodiscard]] virtual auto live_page_count() const -> Size = 0;
    [[nodiscard]] virtual auto version() const -> Size = 0;
};

} // namespace Birch

#endif // BIRCH_PAGE_STORE_H
