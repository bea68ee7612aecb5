#ifndef BIRCH_TREE_CURSOR_H
#define BIRCH_TREE_CURSOR_H

#include "tree.h"

namespace Birch {

/*
 * Two-ended cursor over the entries of a fixed snapshot that fall within a range. Each end keeps
 * the path of nodes from the root down to its current entry. The cursor is exhausted once the
 * ends have met.
 */
class RangeCursor final: public EntryCursor {
public:
    RangeCursor(PageStore &store, std::optional<RootPointer> root, PageHint hint, Comparator cmp, ByteRange range);
    ~RangeCursor() override = default;

    [[nodiscard]] auto next() -> std::optional<EntryGuards> override;
    [[nodiscard]] auto next_back() -> std::optional<EntryGuards> override;
    [[nodiscard]] auto status() const -> Status override;

private:
    struct Frame {
        PageRef page;
        std::optional<LeafView> leaf;
        std::optional<BranchView> branch;
        Size index {};
    };

    using Path = std::vector<Frame>;

    [[nodiscard]] auto start() -> bool;
    [[nodiscard]] auto push(Path &path, const RootPointer &ptr) -> tl::expected<Frame *, Status>;
    [[nodiscard]] auto descend_to_edge(Path &path, const RootPointer &ptr, bool leftmost) -> tl::expected<void, Status>;
    [[nodiscard]] auto seek_front() -> tl::expected<bool, Status>;
    [[nodiscard]] auto seek_back() -> tl::expected<bool, Status>;
    [[nodiscard]] auto advance(Path &path) -> tl::expected<bool, Status>;
    [[nodiscard]] auto retreat(Path &path) -> tl::expected<bool, Status>;
    [[nodiscard]] auto step(bool forward) -> std::optional<EntryGuards>;
    [[nodiscard]] static auto key_at(const Path &path) -> Slice;
    [[nodiscard]] static auto entry_at(const Path &path) -> EntryGuards;

    ByteRange m_range;
    Path m_front;
    Path m_back;
    Status m_status {Status::ok()};
    std::optional<RootPointer> m_root;
    PageStore *m_store {};
    Comparator m_cmp {};
    PageHint m_hint {};
    bool m_is_started {};
    bool m_is_done {};
};

/*
 * Cursor that removes each entry as it is produced. Produces owned keys: the entry's page is no
 * longer part of the tree by the time the key is handed out.
 */
class DrainCursor final: public EntryCursor {
public:
    DrainCursor(BTreeMut &tree, ByteRange range);
    ~DrainCursor() override = default;

    [[nodiscard]] auto next() -> std::optional<EntryGuards> override;
    [[nodiscard]] auto next_back() -> std::optional<EntryGuards> override;
    [[nodiscard]] auto status() const -> Status override;

private:
    [[nodiscard]] auto take(bool from_front) -> std::optional<EntryGuards>;

    ByteRange m_range;
    Status m_status {Status::ok()};
    BTreeMut *m_tree {};
    bool m_is_done {};
};

} // namespace Birch

#endif // BIRCH_TREE_CURSOR_H
