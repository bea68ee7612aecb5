#include "birch/btree.h"
#include "cursor.h"
#include "utils/expect.h"
#include "utils/logging.h"

namespace Birch {

namespace {

    struct Walker {
        PageStore *store {};
        PageHint hint {};
        Comparator cmp {};

        [[nodiscard]] auto read(const RootPointer &ptr) const -> tl::expected<PageRef, Status>
        {
            return read_node(*store, ptr, hint);
        }

        // Find the first or last entry.
        [[nodiscard]] auto edge(const RootPointer &root, bool leftmost) const -> tl::expected<EntryGuards, Status>
        {
            auto ptr = root;
            for (;;) {
                BIRCH_NEW_R(page, read(ptr));
                BIRCH_NEW_R(type, read_node_type(page->data()));
                if (type == NodeType::BRANCH) {
                    BIRCH_NEW_R(branch, BranchView::parse(page->data()));
                    ptr = branch.child(leftmost ? 0 : branch.key_count());
                    continue;
                }
                BIRCH_NEW_R(leaf, LeafView::parse(page->data()));
                if (leaf.count() == 0)
                    return tl::make_unexpected(Status::corruption("leaf node is empty"));
                const auto index = leftmost ? 0 : leaf.count() - 1;
                return EntryGuards {
                    ByteGuard::borrowed(page, leaf.key_offset(index), leaf.key(index).size()),
                    ByteGuard::borrowed(page, leaf.value_offset(index), leaf.value(index).size()),
                };
            }
        }

        [[nodiscard]] auto count(const RootPointer &ptr) const -> tl::expected<Size, Status>
        {
            BIRCH_NEW_R(page, read(ptr));
            BIRCH_NEW_R(type, read_node_type(page->data()));
            if (type == NodeType::LEAF) {
                BIRCH_NEW_R(leaf, LeafView::parse(page->data()));
                return leaf.count();
            }
            BIRCH_NEW_R(branch, BranchView::parse(page->data()));
            Size total {};
            for (Size i {}; i < branch.child_count(); ++i) {
                BIRCH_NEW_R(n, count(branch.child(i)));
                total += n;
            }
            return total;
        }

        [[nodiscard]] auto collect(const RootPointer &ptr, std::vector<PageNumber> &out) const -> tl::expected<void, Status>
        {
            BIRCH_NEW_R(page, read(ptr));
            out.emplace_back(ptr.page);
            BIRCH_NEW_R(type, read_node_type(page->data()));
            if (type == NodeType::BRANCH) {
                BIRCH_NEW_R(branch, BranchView::parse(page->data()));
                for (Size i {}; i < branch.child_count(); ++i)
                    BIRCH_TRY_R(collect(branch.child(i), out));
            }
            return {};
        }

        /*
         * Check the subtree at "ptr". Its keys must be greater than "lower" and no greater than
         * "upper", where given.
         */
        [[nodiscard]] auto verify(const RootPointer &ptr, const Slice *lower, const Slice *upper, Size depth, std::optional<Size> &leaf_depth, bool is_root) const -> tl::expected<void, Status>
        {
            BIRCH_NEW_R(page, read(ptr));
            BIRCH_NEW_R(type, read_node_type(page->data()));

            const auto check_key = [&](const Slice &key, const Slice *prev) -> Status {
                if (prev && cmp(*prev, key) != ThreeWayComparison::LT)
                    return Status::corruption(page_message(ptr.page, "keys are out of order"));
                if (lower && cmp(*lower, key) != ThreeWayComparison::LT)
                    return Status::corruption(page_message(ptr.page, "key is below its lower bound"));
                if (upper && cmp(key, *upper) == ThreeWayComparison::GT)
                    return Status::corruption(page_message(ptr.page, "key is above its upper bound"));
                return Status::ok();
            };

            if (type == NodeType::LEAF) {
                BIRCH_NEW_R(leaf, LeafView::parse(page->data()));
                if (leaf.count() == 0 && !is_root)
                    return tl::make_unexpected(Status::corruption("leaf node is empty"));
                if (leaf_depth && *leaf_depth != depth)
                    return tl::make_unexpected(Status::corruption("leaves are at different depths"));
                leaf_depth = depth;
                for (Size i {}; i < leaf.count(); ++i) {
                    const auto prev = i ? leaf.key(i - 1) : Slice {};
                    if (auto s = check_key(leaf.key(i), i ? &prev : nullptr); !s.is_ok())
                        return tl::make_unexpected(s);
                }
                return {};
            }

            BIRCH_NEW_R(branch, BranchView::parse(page->data()));
            for (Size i {}; i < branch.key_count(); ++i) {
                const auto prev = i ? branch.key(i - 1) : Slice {};
                if (auto s = check_key(branch.key(i), i ? &prev : nullptr); !s.is_ok())
                    return tl::make_unexpected(s);
            }
            for (Size i {}; i < branch.child_count(); ++i) {
                const auto left = i ? branch.key(i - 1) : Slice {};
                const auto right = i < branch.key_count() ? branch.key(i) : Slice {};
                BIRCH_TRY_R(verify(branch.child(i), i ? &left : lower, i < branch.key_count() ? &right : upper, depth + 1, leaf_depth, false));
            }
            return {};
        }
    };

} // namespace

BTree::BTree(std::optional<RootPointer> root, PageHint hint, PageStore &store, Comparator cmp)
    : m_root {root},
      m_hint {hint},
      m_store {&store},
      m_cmp {cmp}
{}

auto BTree::root() const -> std::optional<RootPointer>
{
    return m_root;
}

auto BTree::get(const Slice &key, std::optional<ByteGuard> &out) const -> Status
{
    out.reset();
    if (!m_root)
        return Status::ok();

    auto ptr = *m_root;
    for (;;) {
        auto page = read_node(*m_store, ptr, m_hint);
        if (!page.has_value())
            return page.error();
        auto type = read_node_type((*page)->data());
        if (!type.has_value())
            return type.error();

        if (*type == NodeType::BRANCH) {
            auto branch = BranchView::parse((*page)->data());
            if (!branch.has_value())
                return branch.error();
            ptr = branch->child(find_child(*branch, key, m_cmp));
            continue;
        }
        auto leaf = LeafView::parse((*page)->data());
        if (!leaf.has_value())
            return leaf.error();
        bool found {};
        const auto index = find_entry(*leaf, key, m_cmp, found);
        if (found)
            out.emplace(ByteGuard::borrowed(*page, leaf->value_offset(index), leaf->value(index).size()));
        return Status::ok();
    }
}

auto BTree::range(const ByteRange &range) const -> std::unique_ptr<EntryCursor>
{
    return std::make_unique<RangeCursor>(*m_store, m_root, m_hint, m_cmp, range);
}

auto BTree::len(Size &out) const -> Status
{
    out = 0;
    if (!m_root)
        return Status::ok();
    const auto r = Walker {m_store, m_hint, m_cmp}.count(*m_root);
    if (!r.has_value())
        return r.error();
    out = *r;
    return Status::ok();
}

auto BTree::first(std::optional<EntryGuards> &out) const -> Status
{
    out.reset();
    if (!m_root)
        return Status::ok();
    auto r = Walker {m_store, m_hint, m_cmp}.edge(*m_root, true);
    if (!r.has_value())
        return r.error();
    out.emplace(std::move(*r));
    return Status::ok();
}

auto BTree::last(std::optional<EntryGuards> &out) const -> Status
{
    out.reset();
    if (!m_root)
        return Status::ok();
    auto r = Walker {m_store, m_hint, m_cmp}.edge(*m_root, false);
    if (!r.has_value())
        return r.error();
    out.emplace(std::move(*r));
    return Status::ok();
}

auto BTree::verify() const -> Status
{
    if (!m_root)
        return Status::ok();
    std::optional<Size> leaf_depth;
    const auto r = Walker {m_store, m_hint, m_cmp}.verify(*m_root, nullptr, nullptr, 0, leaf_depth, true);
    return r.has_value() ? Status::ok() : r.error();
}

auto BTree::collect_pages(std::vector<PageNumber> &out) const -> Status
{
    if (!m_root)
        return Status::ok();
    const auto r = Walker {m_store, m_hint, m_cmp}.collect(*m_root, out);
    return r.has_value() ? Status::ok() : r.error();
}

auto BTree::print_debug(bool include_values, std::string &out) const -> Status
{
    out.clear();
    if (!m_root) {
        out = "(empty)\n";
        return Status::ok();
    }

    std::vector<RootPointer> level {*m_root};
    for (Size depth {}; !level.empty(); ++depth) {
        std::vector<RootPointer> next;
        append_level_label(out, depth);
        for (const auto &ptr: level) {
            auto page = read_node(*m_store, ptr, m_hint);
            if (!page.has_value())
                return page.error();
            const auto data = (*page)->data();
            auto type = read_node_type(data);
            if (!type.has_value())
                return type.error();

            if (*type == NodeType::BRANCH) {
                auto branch = BranchView::parse(data);
                if (!branch.has_value())
                    return branch.error();
                const auto image = NodeImage::from_branch(*branch);
                append_node_summary(out, ptr.page, image.keys, nullptr);
                next.insert(end(next), begin(image.children), end(image.children));
            } else {
                auto leaf = LeafView::parse(data);
                if (!leaf.has_value())
                    return leaf.error();
                const auto image = NodeImage::from_leaf(*leaf);
                append_node_summary(out, ptr.page, image.keys, include_values ? &image.values : nullptr);
            }
        }
        out += '\n';
        level = std::move(next);
    }
    return Status::ok();
}

} // namespace Birch
