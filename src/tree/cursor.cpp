#include "cursor.h"
#include "utils/expect.h"

namespace Birch {

RangeCursor::RangeCursor(PageStore &store, std::optional<RootPointer> root, PageHint hint, Comparator cmp, ByteRange range)
    : m_range {std::move(range)},
      m_root {root},
      m_store {&store},
      m_cmp {cmp},
      m_hint {hint}
{}

auto RangeCursor::status() const -> Status
{
    return m_status;
}

auto RangeCursor::next() -> std::optional<EntryGuards>
{
    return step(true);
}

auto RangeCursor::next_back() -> std::optional<EntryGuards>
{
    return step(false);
}

auto RangeCursor::step(bool forward) -> std::optional<EntryGuards>
{
    if (!start() || m_is_done)
        return std::nullopt;

    auto &path = forward ? m_front : m_back;
    auto entry = entry_at(path);

    // The ends have met, and this is the last entry.
    if (m_cmp(key_at(m_front), key_at(m_back)) != ThreeWayComparison::LT) {
        m_is_done = true;
        return entry;
    }
    auto moved = forward ? advance(path) : retreat(path);
    if (!moved.has_value()) {
        m_status = moved.error();
        m_is_done = true;
    } else if (!*moved) {
        m_is_done = true;
    }
    return entry;
}

auto RangeCursor::start() -> bool
{
    if (m_is_started)
        return m_status.is_ok();
    m_is_started = true;

    if (!m_root) {
        m_is_done = true;
        return true;
    }
    auto found = seek_front();
    if (found.has_value() && *found)
        found = seek_back();
    if (!found.has_value()) {
        m_status = found.error();
        m_is_done = true;
        return false;
    }
    if (!*found || m_cmp(key_at(m_front), key_at(m_back)) == ThreeWayComparison::GT)
        m_is_done = true;
    return true;
}

auto RangeCursor::push(Path &path, const RootPointer &ptr) -> tl::expected<Frame *, Status>
{
    BIRCH_NEW_R(page, read_node(*m_store, ptr, m_hint));
    BIRCH_NEW_R(type, read_node_type(page->data()));
    Frame frame;
    if (type == NodeType::LEAF) {
        BIRCH_NEW_R(leaf, LeafView::parse(page->data()));
        if (leaf.count() == 0)
            return tl::make_unexpected(Status::corruption("leaf node is empty"));
        frame.leaf = leaf;
    } else {
        BIRCH_NEW_R(branch, BranchView::parse(page->data()));
        frame.branch = branch;
    }
    frame.page = std::move(page);
    path.emplace_back(std::move(frame));
    return &path.back();
}

auto RangeCursor::descend_to_edge(Path &path, const RootPointer &ptr, bool leftmost) -> tl::expected<void, Status>
{
    auto next = ptr;
    for (;;) {
        BIRCH_NEW_R(frame, push(path, next));
        if (frame->leaf) {
            frame->index = leftmost ? 0 : frame->leaf->count() - 1;
            return {};
        }
        frame->index = leftmost ? 0 : frame->branch->key_count();
        next = frame->branch->child(frame->index);
    }
}

auto RangeCursor::seek_front() -> tl::expected<bool, Status>
{
    using Kind = ByteBound::Kind;
    const auto &bound = m_range.lower;
    const Slice key {bound.key};
    m_front.clear();

    auto next = *m_root;
    for (;;) {
        BIRCH_NEW_R(frame, push(m_front, next));
        if (frame->branch) {
            const auto &branch = *frame->branch;
            Size index {};
            if (bound.kind == Kind::INCLUDED) {
                index = find_child(branch, key, m_cmp);
            } else if (bound.kind == Kind::EXCLUDED) {
                // Keys equal to a separator live in the child to its left.
                while (index < branch.key_count() && m_cmp(key, branch.key(index)) != ThreeWayComparison::LT)
                    index++;
            }
            frame->index = index;
            next = branch.child(index);
            continue;
        }
        const auto &leaf = *frame->leaf;
        Size index {};
        if (bound.kind != Kind::UNBOUNDED) {
            bool found {};
            index = find_entry(leaf, key, m_cmp, found);
            if (found && bound.kind == Kind::EXCLUDED)
                index++;
        }
        if (index < leaf.count()) {
            frame->index = index;
            return true;
        }
        frame->index = leaf.count() - 1;
        return advance(m_front);
    }
}

auto RangeCursor::seek_back() -> tl::expected<bool, Status>
{
    using Kind = ByteBound::Kind;
    const auto &bound = m_range.upper;
    const Slice key {bound.key};
    m_back.clear();

    auto next = *m_root;
    for (;;) {
        BIRCH_NEW_R(frame, push(m_back, next));
        if (frame->branch) {
            const auto &branch = *frame->branch;
            auto index = branch.key_count();
            if (bound.kind != Kind::UNBOUNDED)
                index = find_child(branch, key, m_cmp);
            frame->index = index;
            next = branch.child(index);
            continue;
        }
        const auto &leaf = *frame->leaf;
        // One past the last entry that is within the bound.
        auto end = leaf.count();
        if (bound.kind != Kind::UNBOUNDED) {
            bool found {};
            end = find_entry(leaf, key, m_cmp, found);
            if (found && bound.kind == Kind::INCLUDED)
                end++;
        }
        if (end > 0) {
            frame->index = end - 1;
            return true;
        }
        frame->index = 0;
        return retreat(m_back);
    }
}

auto RangeCursor::advance(Path &path) -> tl::expected<bool, Status>
{
    BIRCH_EXPECT_FALSE(path.empty());
    if (++path.back().index < path.back().leaf->count())
        return true;

    path.pop_back();
    while (!path.empty()) {
        auto &frame = path.back();
        if (++frame.index < frame.branch->child_count()) {
            const auto child = frame.branch->child(frame.index);
            BIRCH_TRY_R(descend_to_edge(path, child, true));
            return true;
        }
        path.pop_back();
    }
    return false;
}

auto RangeCursor::retreat(Path &path) -> tl::expected<bool, Status>
{
    BIRCH_EXPECT_FALSE(path.empty());
    if (path.back().index > 0) {
        path.back().index--;
        return true;
    }

    path.pop_back();
    while (!path.empty()) {
        auto &frame = path.back();
        if (frame.index > 0) {
            const auto child = frame.branch->child(--frame.index);
            BIRCH_TRY_R(descend_to_edge(path, child, false));
            return true;
        }
        path.pop_back();
    }
    return false;
}

auto RangeCursor::key_at(const Path &path) -> Slice
{
    const auto &frame = path.back();
    return frame.leaf->key(frame.index);
}

auto RangeCursor::entry_at(const Path &path) -> EntryGuards
{
    const auto &frame = path.back();
    const auto &leaf = *frame.leaf;
    return EntryGuards {
        ByteGuard::borrowed(frame.page, leaf.key_offset(frame.index), leaf.key(frame.index).size()),
        ByteGuard::borrowed(frame.page, leaf.value_offset(frame.index), leaf.value(frame.index).size()),
    };
}

DrainCursor::DrainCursor(BTreeMut &tree, ByteRange range)
    : m_range {std::move(range)},
      m_tree {&tree}
{}

auto DrainCursor::status() const -> Status
{
    return m_status;
}

auto DrainCursor::next() -> std::optional<EntryGuards>
{
    return take(true);
}

auto DrainCursor::next_back() -> std::optional<EntryGuards>
{
    return take(false);
}

auto DrainCursor::take(bool from_front) -> std::optional<EntryGuards>
{
    if (m_is_done)
        return std::nullopt;

    // Find the edge entry of whatever is left of the range in the current tree.
    auto cursor = m_tree->range(m_range);
    auto edge = from_front ? cursor->next() : cursor->next_back();
    if (!edge) {
        m_status = cursor->status();
        m_is_done = true;
        return std::nullopt;
    }
    auto key = edge->key.bytes().to_string();
    edge.reset();
    cursor.reset();

    std::optional<ByteGuard> value;
    if (auto s = m_tree->remove(key, value); !s.is_ok()) {
        m_status = s;
        m_is_done = true;
        return std::nullopt;
    }
    if (!value) {
        m_status = Status::logic_error("drained entry is missing from the tree");
        m_is_done = true;
        return std::nullopt;
    }

    // Later entries are taken from what remains between the bounds.
    auto &bound = from_front ? m_range.lower : m_range.upper;
    bound = ByteBound {ByteBound::Kind::EXCLUDED, key};
    return EntryGuards {ByteGuard::owned(std::move(key)), std::move(*value)};
}

} // namespace Birch
