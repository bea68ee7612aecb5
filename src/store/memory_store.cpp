#include "birch/memory_store.h"
#include "birch/options.h"
#include "utils/expect.h"
#include "utils/logging.h"

namespace Birch {

MemoryStore::MemoryStore(Size page_size)
    : m_page_size {page_size}
{
    // Node offsets are 16 bits wide, and entry limits are derived from the page size.
    BIRCH_EXPECT_GE(page_size, MINIMUM_PAGE_SIZE);
    BIRCH_EXPECT_LE(page_size, MAXIMUM_PAGE_SIZE);
}

auto MemoryStore::page_size() const -> Size
{
    return m_page_size;
}

auto MemoryStore::allocate_page(PageMut &out) -> Status
{
    std::lock_guard lock {m_mutex};
    PageNumber id;
    if (m_free_list.empty()) {
        id.value = m_next_id++;
    } else {
        id = m_free_list.back();
        m_free_list.pop_back();
    }
    // Always hand out a fresh buffer: a released page may still be referenced by a guard.
    out = std::make_shared<Page>(id, m_page_size);
    m_pages.emplace(id.value, out);
    m_uncommitted.insert(id.value);
    return Status::ok();
}

auto MemoryStore::read_page(PageNumber id, PageHint, PageRef &out) -> Status
{
    std::lock_guard lock {m_mutex};
    const auto itr = m_pages.find(id.value);
    if (itr == end(m_pages))
        return Status::corruption(page_message(id, "not allocated"));
    out = itr->second;
    return Status::ok();
}

auto MemoryStore::write_page(PageNumber id, PageMut &out) -> Status
{
    std::lock_guard lock {m_mutex};
    if (m_uncommitted.find(id.value) == end(m_uncommitted))
        return Status::logic_error(page_message(id, "not writable"));
    out = m_pages.at(id.value);
    return Status::ok();
}

auto MemoryStore::is_uncommitted(PageNumber id) const -> bool
{
    std::lock_guard lock {m_mutex};
    return m_uncommitted.find(id.value) != end(m_uncommitted);
}

auto MemoryStore::free_page(PageNumber id) -> void
{
    std::lock_guard lock {m_mutex};
    BIRCH_EXPECT_EQ(m_uncommitted.count(id.value), 1);
    m_uncommitted.erase(id.value);
    release(id);
}

auto MemoryStore::mark_freed(PageNumber id) -> void
{
    std::lock_guard lock {m_mutex};
    BIRCH_EXPECT_EQ(m_uncommitted.count(id.value), 0);
    m_marked.emplace_back(id);
}

auto MemoryStore::commit(Size &version) -> Status
{
    std::lock_guard lock {m_mutex};
    m_uncommitted.clear();
    m_version++;
    if (!m_marked.empty())
        m_pending.emplace_back(PendingBatch {m_version, std::move(m_marked)});
    m_marked.clear();
    version = m_version;
    return Status::ok();
}

auto MemoryStore::rollback() -> void
{
    std::lock_guard lock {m_mutex};
    for (const auto &id: m_uncommitted)
        release(PageNumber {id});
    m_uncommitted.clear();
    m_marked.clear();
}

auto MemoryStore::reclaim(Size oldest_live_version) -> Size
{
    std::lock_guard lock {m_mutex};
    Size count {};
    auto itr = begin(m_pending);
    // Batches are ordered by version.
    for (; itr != end(m_pending) && itr->version <= oldest_live_version; ++itr) {
        for (const auto &id: itr->pages)
            release(id);
        count += itr->pages.size();
    }
    m_pending.erase(begin(m_pending), itr);
    return count;
}

auto MemoryStore::live_page_count() const -> Size
{
    std::lock_guard lock {m_mutex};
    return m_pages.size();
}

auto MemoryStore::version() const -> Size
{
    std::lock_guard lock {m_mutex};
    return m_version;
}

auto MemoryStore::pending_count() const -> Size
{
    std::lock_guard lock {m_mutex};
    Size count {};
    for (const auto &batch: m_pending)
        count += batch.pages.size();
    return count;
}

auto MemoryStore::release(PageNumber id) -> void
{
    m_pages.erase(id.value);
    m_free_list.emplace_back(id);
}

} // namespace Birch
