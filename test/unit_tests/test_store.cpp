#include <cstring>
#include "unit_tests.h"

namespace Birch {

class MemoryStoreTests: public testing::Test {
public:
    MemoryStoreTests()
        : store {SMALL_PAGE_SIZE}
    {}

    auto allocate(const std::string &message = {}) -> PageNumber
    {
        PageMut page;
        EXPECT_OK(store.allocate_page(page));
        std::memcpy(page->span().data(), message.data(), message.size());
        return page->id();
    }

    auto read(PageNumber id, Size size) -> std::string
    {
        PageRef page;
        EXPECT_OK(store.read_page(id, PageHint::NONE, page));
        return page ? page->data().range(0, size).to_string() : std::string {};
    }

    auto commit() -> Size
    {
        Size version {};
        EXPECT_OK(store.commit(version));
        return version;
    }

    MemoryStore store;
};

TEST_F(MemoryStoreTests, FreshStoreIsEmpty)
{
    ASSERT_EQ(store.page_size(), SMALL_PAGE_SIZE);
    ASSERT_EQ(store.live_page_count(), 0);
    ASSERT_EQ(store.version(), 0);
    ASSERT_EQ(store.pending_count(), 0);
}

TEST_F(MemoryStoreTests, AllocatedPagesAreUncommittedUntilCommit)
{
    const auto a = allocate("hello");
    const auto b = allocate("world");
    ASSERT_FALSE(a.is_null());
    ASSERT_NE(a, b);
    ASSERT_TRUE(store.is_uncommitted(a));
    ASSERT_EQ(read(a, 5), "hello");
    ASSERT_EQ(store.live_page_count(), 2);

    ASSERT_EQ(commit(), 1);
    ASSERT_FALSE(store.is_uncommitted(a));
    ASSERT_EQ(read(b, 5), "world");
}

TEST_F(MemoryStoreTests, ReadingUnallocatedPageIsCorruption)
{
    PageRef page;
    ASSERT_TRUE(store.read_page(PageNumber {42}, PageHint::NONE, page).is_corruption());
}

TEST_F(MemoryStoreTests, OnlyUncommittedPagesAreWritable)
{
    const auto id = allocate();
    PageMut page;
    ASSERT_OK(store.write_page(id, page));
    std::memcpy(page->span().data(), "abc", 3);
    ASSERT_EQ(read(id, 3), "abc");

    commit();
    ASSERT_TRUE(store.write_page(id, page).is_logic_error());
}

TEST_F(MemoryStoreTests, FreedUncommittedPageIsReused)
{
    const auto id = allocate();
    store.free_page(id);
    ASSERT_EQ(store.live_page_count(), 0);
    ASSERT_EQ(allocate(), id);
}

TEST_F(MemoryStoreTests, RollbackReleasesUncommittedPages)
{
    const auto kept = allocate("kept");
    commit();
    allocate();
    allocate();
    ASSERT_EQ(store.live_page_count(), 3);

    store.rollback();
    ASSERT_EQ(store.live_page_count(), 1);
    ASSERT_EQ(read(kept, 4), "kept");
    ASSERT_EQ(store.version(), 1);
}

TEST_F(MemoryStoreTests, MarkedPagesWaitForOldestReader)
{
    const auto a = allocate();
    const auto b = allocate();
    commit(); // Version 1.

    store.mark_freed(a);
    commit(); // Version 2 frees "a".
    store.mark_freed(b);
    commit(); // Version 3 frees "b".
    ASSERT_EQ(store.pending_count(), 2);

    // A reader at version 1 can still reach both pages.
    ASSERT_EQ(store.reclaim(1), 0);
    ASSERT_EQ(store.live_page_count(), 2);

    ASSERT_EQ(store.reclaim(2), 1);
    ASSERT_EQ(store.live_page_count(), 1);
    ASSERT_EQ(store.pending_count(), 1);

    ASSERT_EQ(store.reclaim(3), 1);
    ASSERT_EQ(store.live_page_count(), 0);
    ASSERT_EQ(store.pending_count(), 0);
}

TEST_F(MemoryStoreTests, RollbackForgetsMarks)
{
    const auto a = allocate();
    commit();
    store.mark_freed(a);
    store.rollback();
    commit();
    ASSERT_EQ(store.pending_count(), 0);
    ASSERT_EQ(store.reclaim(store.version()), 0);
    ASSERT_EQ(store.live_page_count(), 1);
}

TEST_F(MemoryStoreTests, ReleasedPageStaysReadableThroughOldReference)
{
    const auto id = allocate("old");
    PageRef page;
    ASSERT_OK(store.read_page(id, PageHint::NONE, page));
    store.free_page(id);

    // The page number is handed out again, but with a new buffer.
    PageMut fresh;
    ASSERT_OK(store.allocate_page(fresh));
    ASSERT_EQ(fresh->id(), id);
    std::memcpy(fresh->span().data(), "new", 3);
    ASSERT_EQ(page->data().range(0, 3).to_string(), "old");
}

#ifndef NDEBUG
TEST(MemoryStoreDeathTests, PageSizeMustBeInRange)
{
    ASSERT_DEATH(MemoryStore store {MINIMUM_PAGE_SIZE / 2}, "");
    ASSERT_DEATH(MemoryStore store {0x10000}, "");
}
#endif // NDEBUG

} // namespace Birch
