#ifndef BIRCH_BTREE_H
#define BIRCH_BTREE_H

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "access_guard.h"
#include "bounds.h"
#include "page_store.h"

namespace Birch {

using Comparator = ThreeWayComparison (*)(const Slice &, const Slice &);

/*
 * Largest key.size() + value.size() that a tree on pages of the given size accepts.
 */
[[nodiscard]] auto max_entry_size(Size page_size) -> Size;

struct EntryGuards {
    ByteGuard key;
    ByteGuard value;
};

/*
 * Two-ended sequence of tree entries. next() and next_back() return an empty optional once the
 * ends meet, or once an error is encountered. status() tells the two apart.
 */
class EntryCursor {
public:
    virtual ~EntryCursor() = default;
    [[nodiscard]] virtual auto next() -> std::optional<EntryGuards> = 0;
    [[nodiscard]] virtual auto next_back() -> std::optional<EntryGuards> = 0;
    [[nodiscard]] virtual auto status() const -> Status = 0;
};

/*
 * Read-only view of the tree rooted at a fixed root pointer.
 */
class BTree final {
public:
    BTree(std::optional<RootPointer> root, PageHint hint, PageStore &store, Comparator cmp);

    [[nodiscard]] auto root() const -> std::optional<RootPointer>;
    [[nodiscard]] auto get(const Slice &key, std::optional<ByteGuard> &out) const -> Status;
    [[nodiscard]] auto range(const ByteRange &range) const -> std::unique_ptr<EntryCursor>;
    [[nodiscard]] auto len(Size &out) const -> Status;
    [[nodiscard]] auto first(std::optional<EntryGuards> &out) const -> Status;
    [[nodiscard]] auto last(std::optional<EntryGuards> &out) const -> Status;

    // Walk the whole tree, checking checksums, node layout, ordering, and depth.
    [[nodiscard]] auto verify() const -> Status;

    // Page numbers of every node reachable from the root.
    [[nodiscard]] auto collect_pages(std::vector<PageNumber> &out) const -> Status;

    [[nodiscard]] auto print_debug(bool include_values, std::string &out) const -> Status;

private:
    std::optional<RootPointer> m_root;
    PageHint m_hint {};
    PageStore *m_store {};
    Comparator m_cmp {};
};

/*
 * Copy-on-write tree. Every node that changes is written to a new page. Committed pages that
 * become unreachable are appended to the freed list shared with the owning transaction; pages
 * allocated since the last commit are released right away. A failed operation leaves the root,
 * the store, and the freed list as they were.
 *
 * Only one BTreeMut may exist for a given root at a time.
 */
class BTreeMut final {
public:
    BTreeMut(std::optional<RootPointer> root, PageStore &store, std::vector<PageNumber> &freed, Comparator cmp);

    [[nodiscard]] auto root() const -> std::optional<RootPointer>;
    [[nodiscard]] auto as_tree() const -> BTree;
    [[nodiscard]] auto get(const Slice &key, std::optional<ByteGuard> &out) const -> Status;
    [[nodiscard]] auto range(const ByteRange &range) const -> std::unique_ptr<EntryCursor>;
    [[nodiscard]] auto len(Size &out) const -> Status;

    [[nodiscard]] auto insert(const Slice &key, const Slice &value, std::optional<ByteGuard> &old) -> Status;
    [[nodiscard]] auto insert_reserve(const Slice &key, Size length, AccessGuardMut &out) -> Status;
    [[nodiscard]] auto remove(const Slice &key, std::optional<ByteGuard> &out) -> Status;
    [[nodiscard]] auto pop_first(std::optional<EntryGuards> &out) -> Status;
    [[nodiscard]] auto pop_last(std::optional<EntryGuards> &out) -> Status;

    // Entries are removed one at a time, as they are produced.
    [[nodiscard]] auto drain(const ByteRange &range) -> std::unique_ptr<EntryCursor>;

    // Fill in the checksums that refer to pages written since the last commit.
    [[nodiscard]] auto finalize_dirty_checksums() -> Status;

    [[nodiscard]] auto print_debug(bool include_values, std::string &out) const -> Status;

private:
    enum class Action {
        INSERT,
        RESERVE,
        REMOVE,
    };

    [[nodiscard]] auto apply(Action action, const Slice &key, const Slice &value, std::optional<ByteGuard> &old, AccessGuardMut *reserved) -> Status;
    [[nodiscard]] auto pop_edge(bool from_front, std::optional<EntryGuards> &out) -> Status;

    std::optional<RootPointer> m_root;
    PageStore *m_store {};
    std::vector<PageNumber> *m_freed {};
    Comparator m_cmp {};
};

} // namespace Birch

#endif // BIRCH_BTREE_H
