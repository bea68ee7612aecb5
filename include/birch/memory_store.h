#ifndef BIRCH_MEMORY_STORE_H
#define BIRCH_MEMORY_STORE_H

#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "page_store.h"

namespace Birch {

/*
 * Page store that keeps every page on the heap. Safe to use from multiple threads.
 */
class MemoryStore: public PageStore {
public:
    explicit MemoryStore(Size page_size);
    ~MemoryStore() override = default;

    [[nodiscard]] auto page_size() const -> Size override;
    [[nodiscard]] auto allocate_page(PageMut &out) -> Status override;
    [[nodiscard]] auto read_page(PageNumber id, PageHint hint, PageRef &out) -> Status override;
    [[nodiscard]] auto write_page(PageNumber id, PageMut &out) -> Status override;
    [[nodiscard]] auto is_uncommitted(PageNumber id) const -> bool override;
    auto free_page(PageNumber id) -> void override;
    auto mark_freed(PageNumber id) -> void override;
    [[nodiscard]] auto commit(Size &version) -> Status override;
    auto rollback() -> void override;
    auto reclaim(Size oldest_live_version) -> Size override;
    [[nodiscard]] auto live_page_count() const -> Size override;
    [[nodiscard]] auto version() const -> Size override;

    // Number of pages waiting for reclamation.
    [[nodiscard]] auto pending_count() const -> Size;

private:
    struct PendingBatch {
        Size version {};
        std::vector<PageNumber> pages;
    };

    auto release(PageNumber id) -> void;

    mutable std::mutex m_mutex;
    std::unordered_map<std::uint64_t, PageMut> m_pages;
    std::unordered_set<std::uint64_t> m_uncommitted;
    std::vector<PageNumber> m_free_list;
    std::vector<PageNumber> m_marked;
    std::vector<PendingBatch> m_pending;
    std::uint64_t m_next_id {1};
    Size m_page_size {};
    Size m_version {};
};

} // namespace Birch

#endif // BIRCH_MEMORY_STORE_H
