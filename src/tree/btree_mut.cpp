#include <algorithm>
#include "birch/btree.h"
#include "cursor.h"
#include "utils/encoding.h"
#include "utils/expect.h"

namespace Birch {

namespace {

    // New contents for the root of a subtree, not yet written.
    struct Rewrite {
        bool changed {};
        NodeImage image;
    };

    /*
     * State for one insert or remove. Keeps every page it reads pinned, so that the slices held by
     * node images stay valid, and remembers which pages it allocated and which it made
     * unreachable. Nothing is released until the whole operation has succeeded.
     */
    class Mutation final {
    public:
        Mutation(PageStore &store, Comparator cmp, const Slice &key)
            : m_key {key},
              m_store {&store},
              m_cmp {cmp}
        {}

        auto set_value(const Slice &value) -> void
        {
            m_value = value;
        }

        auto set_reserve(Size length) -> void
        {
            m_reserve.emplace(length, '\x00');
            m_value = *m_reserve;
        }

        auto set_remove() -> void
        {
            m_is_remove = true;
        }

        [[nodiscard]] auto old_value() -> std::optional<ByteGuard> &
        {
            return m_old;
        }

        [[nodiscard]] auto reserved() -> AccessGuardMut &
        {
            return m_reserved;
        }

        [[nodiscard]] auto run(const std::optional<RootPointer> &root) -> tl::expected<std::optional<RootPointer>, Status>
        {
            if (!root) {
                if (m_is_remove)
                    return std::optional<RootPointer> {};
                NodeImage image;
                image.keys.emplace_back(m_key);
                image.values.emplace_back(m_value);
                return finish_root(std::move(image));
            }
            BIRCH_NEW_R(result, rewrite(*root));
            if (!result.changed)
                return root;
            m_retired.emplace_back(root->page);
            return finish_root(std::move(result.image));
        }

        // Release the pages that were made unreachable.
        auto commit(std::vector<PageNumber> &freed) -> void
        {
            for (const auto &id: m_retired) {
                if (m_store->is_uncommitted(id)) {
                    m_store->free_page(id);
                } else {
                    freed.emplace_back(id);
                }
            }
            m_retired.clear();
            m_allocated.clear();
        }

        // Undo the allocations made so far.
        auto abandon() -> void
        {
            for (const auto &id: m_allocated)
                m_store->free_page(id);
            m_allocated.clear();
            m_retired.clear();
            m_reserved = AccessGuardMut {};
        }

    private:
        [[nodiscard]] auto read(const RootPointer &ptr) -> tl::expected<PageRef, Status>
        {
            BIRCH_NEW_R(page, read_node(*m_store, ptr, PageHint::NONE));
            m_pins.emplace_back(page);
            return page;
        }

        [[nodiscard]] auto read_image(const RootPointer &ptr) -> tl::expected<NodeImage, Status>
        {
            BIRCH_NEW_R(page, read(ptr));
            BIRCH_NEW_R(type, read_node_type(page->data()));
            if (type == NodeType::LEAF) {
                BIRCH_NEW_R(leaf, LeafView::parse(page->data()));
                return NodeImage::from_leaf(leaf);
            }
            BIRCH_NEW_R(branch, BranchView::parse(page->data()));
            return NodeImage::from_branch(branch);
        }

        [[nodiscard]] auto write(const NodeImage &image) -> tl::expected<RootPointer, Status>
        {
            PageMut page;
            if (auto s = m_store->allocate_page(page); !s.is_ok())
                return tl::make_unexpected(s);
            m_allocated.emplace_back(page->id());
            image.write(page->span());

            // Locate the region reserved by insert_reserve(), if it landed on this page.
            if (m_reserve && image.is_leaf()) {
                for (Size i {}; i < image.values.size(); ++i) {
                    if (image.values[i].data() != m_reserve->data())
                        continue;
                    BIRCH_NEW_R(leaf, LeafView::parse(page->data()));
                    m_reserved = AccessGuardMut {page, leaf.value_offset(i), m_reserve->size()};
                }
            }
            return RootPointer {page->id(), PLACEHOLDER_CHECKSUM};
        }

        // Write an image as one node, or as several if it does not fit on a page.
        [[nodiscard]] auto write_pieces(const NodeImage &image, std::vector<RootPointer> &ptrs, std::vector<Slice> &separators) -> tl::expected<void, Status>
        {
            const auto page_size = m_store->page_size();
            ptrs.clear();
            separators.clear();
            if (image.encoded_size() <= page_size) {
                BIRCH_NEW_R(ptr, write(image));
                ptrs.emplace_back(ptr);
                return {};
            }
            const auto units = image.is_leaf() ? image.keys.size() : image.children.size();
            for (Size n {2}; n <= units; ++n) {
                std::vector<NodeImage> pieces;
                split_image(image, n, pieces, separators);
                const auto fits = std::all_of(begin(pieces), end(pieces), [page_size](const auto &piece) {
                    return piece.encoded_size() <= page_size;
                });
                if (!fits)
                    continue;
                for (const auto &piece: pieces) {
                    BIRCH_NEW_R(ptr, write(piece));
                    ptrs.emplace_back(ptr);
                }
                return {};
            }
            return tl::make_unexpected(Status::logic_error("node cannot be split"));
        }

        /*
         * Replace children "lo" through "hi" of "parent", along with the keys between them, with
         * the node(s) that "image" becomes once written.
         */
        [[nodiscard]] auto place(NodeImage &parent, Size lo, Size hi, const NodeImage &image) -> tl::expected<void, Status>
        {
            std::vector<RootPointer> ptrs;
            std::vector<Slice> separators;
            BIRCH_TRY_R(write_pieces(image, ptrs, separators));

            auto &children = parent.children;
            auto &keys = parent.keys;
            children.erase(begin(children) + long(lo), begin(children) + long(hi + 1));
            keys.erase(begin(keys) + long(lo), begin(keys) + long(hi));
            children.insert(begin(children) + long(lo), begin(ptrs), end(ptrs));
            keys.insert(begin(keys) + long(lo), begin(separators), end(separators));
            return {};
        }

        [[nodiscard]] auto replace_child(NodeImage &parent, Size index, const NodeImage &child) -> tl::expected<void, Status>
        {
            m_retired.emplace_back(parent.children[index].page);

            const auto underflow = child.encoded_size() < min_node_size(m_store->page_size());
            if (!underflow || parent.children.size() == 1)
                return place(parent, index, index, child);

            // Combine with a sibling. If the pair does not fit on one page, it is split again.
            const auto lo = index + 1 < parent.children.size() ? index : index - 1;
            const auto hi = lo + 1;
            const auto sibling_ptr = parent.children[lo == index ? hi : lo];
            BIRCH_NEW_R(sibling, read_image(sibling_ptr));
            if (sibling.type != child.type)
                return tl::make_unexpected(Status::corruption("sibling nodes have different types"));
            m_retired.emplace_back(sibling_ptr.page);

            const auto merged = lo == index
                                    ? merge_images(child, parent.keys[lo], sibling)
                                    : merge_images(sibling, parent.keys[lo], child);
            return place(parent, lo, hi, merged);
        }

        [[nodiscard]] auto rewrite(const RootPointer &ptr) -> tl::expected<Rewrite, Status>
        {
            BIRCH_NEW_R(page, read(ptr));
            BIRCH_NEW_R(type, read_node_type(page->data()));
            if (type == NodeType::LEAF) {
                BIRCH_NEW_R(leaf, LeafView::parse(page->data()));
                return rewrite_leaf(page, leaf);
            }
            BIRCH_NEW_R(branch, BranchView::parse(page->data()));
            const auto index = find_child(branch, m_key, m_cmp);
            BIRCH_NEW_R(child, rewrite(branch.child(index)));
            if (!child.changed)
                return Rewrite {};

            auto image = NodeImage::from_branch(branch);
            BIRCH_TRY_R(replace_child(image, index, child.image));
            return Rewrite {true, std::move(image)};
        }

        [[nodiscard]] auto rewrite_leaf(const PageRef &page, const LeafView &leaf) -> Rewrite
        {
            bool found {};
            const auto index = find_entry(leaf, m_key, m_cmp, found);
            if (m_is_remove && !found)
                return Rewrite {};
            if (found)
                m_old.emplace(ByteGuard::borrowed(page, leaf.value_offset(index), leaf.value(index).size()));

            auto image = NodeImage::from_leaf(leaf);
            const auto at = begin(image.keys) + long(index);
            const auto value_at = begin(image.values) + long(index);
            if (m_is_remove) {
                image.keys.erase(at);
                image.values.erase(value_at);
            } else if (found) {
                *at = m_key;
                *value_at = m_value;
            } else {
                image.keys.insert(at, m_key);
                image.values.insert(value_at, m_value);
            }
            return Rewrite {true, std::move(image)};
        }

        [[nodiscard]] auto finish_root(NodeImage image) -> tl::expected<std::optional<RootPointer>, Status>
        {
            for (;;) {
                if (image.is_leaf() && image.keys.empty())
                    return std::optional<RootPointer> {};
                // A branch with a single child is replaced by the child.
                if (!image.is_leaf() && image.children.size() == 1)
                    return std::optional<RootPointer> {image.children.front()};

                std::vector<RootPointer> ptrs;
                std::vector<Slice> separators;
                BIRCH_TRY_R(write_pieces(image, ptrs, separators));
                if (ptrs.size() == 1)
                    return std::optional<RootPointer> {ptrs.front()};

                // The root was split: grow the tree by one level.
                NodeImage root;
                root.type = NodeType::BRANCH;
                root.children = std::move(ptrs);
                root.keys = std::move(separators);
                image = std::move(root);
            }
        }

        std::vector<PageRef> m_pins;
        std::vector<PageNumber> m_allocated;
        std::vector<PageNumber> m_retired;
        std::optional<std::string> m_reserve;
        std::optional<ByteGuard> m_old;
        AccessGuardMut m_reserved;
        Slice m_key;
        Slice m_value;
        PageStore *m_store {};
        Comparator m_cmp {};
        bool m_is_remove {};
    };

    [[nodiscard]] auto finalize(PageStore &store, const RootPointer &ptr) -> tl::expected<RootPointer, Status>
    {
        if (!store.is_uncommitted(ptr.page))
            return ptr;

        PageMut page;
        if (auto s = store.write_page(ptr.page, page); !s.is_ok())
            return tl::make_unexpected(s);
        BIRCH_NEW_R(type, read_node_type(page->data()));
        if (type == NodeType::BRANCH) {
            BIRCH_NEW_R(branch, BranchView::parse(page->data()));
            for (Size i {}; i < branch.child_count(); ++i) {
                const auto child = branch.child(i);
                BIRCH_NEW_R(fixed, finalize(store, child));
                if (fixed.checksum != child.checksum)
                    put_u32(page->span().data() + BranchView::child_offset(i) + sizeof(std::uint64_t), fixed.checksum);
            }
        }
        return RootPointer {ptr.page, page_checksum(page->data())};
    }

} // namespace

BTreeMut::BTreeMut(std::optional<RootPointer> root, PageStore &store, std::vector<PageNumber> &freed, Comparator cmp)
    : m_root {root},
      m_store {&store},
      m_freed {&freed},
      m_cmp {cmp}
{}

auto BTreeMut::root() const -> std::optional<RootPointer>
{
    return m_root;
}

auto BTreeMut::as_tree() const -> BTree
{
    return BTree {m_root, PageHint::NONE, *m_store, m_cmp};
}

auto BTreeMut::get(const Slice &key, std::optional<ByteGuard> &out) const -> Status
{
    return as_tree().get(key, out);
}

auto BTreeMut::range(const ByteRange &range) const -> std::unique_ptr<EntryCursor>
{
    return as_tree().range(range);
}

auto BTreeMut::len(Size &out) const -> Status
{
    return as_tree().len(out);
}

auto BTreeMut::print_debug(bool include_values, std::string &out) const -> Status
{
    return as_tree().print_debug(include_values, out);
}

auto BTreeMut::insert(const Slice &key, const Slice &value, std::optional<ByteGuard> &old) -> Status
{
    return apply(Action::INSERT, key, value, old, nullptr);
}

auto BTreeMut::insert_reserve(const Slice &key, Size length, AccessGuardMut &out) -> Status
{
    if (key.size() + length > max_entry_size(m_store->page_size()))
        return Status::invalid_argument("entry is too large");
    std::optional<ByteGuard> old;
    const std::string placeholder(length, '\x00');
    return apply(Action::RESERVE, key, placeholder, old, &out);
}

auto BTreeMut::remove(const Slice &key, std::optional<ByteGuard> &out) -> Status
{
    return apply(Action::REMOVE, key, {}, out, nullptr);
}

auto BTreeMut::apply(Action action, const Slice &key, const Slice &value, std::optional<ByteGuard> &old, AccessGuardMut *reserved) -> Status
{
    old.reset();
    if (action != Action::REMOVE && key.size() + value.size() > max_entry_size(m_store->page_size()))
        return Status::invalid_argument("entry is too large");

    Mutation mutation {*m_store, m_cmp, key};
    if (action == Action::INSERT) {
        mutation.set_value(value);
    } else if (action == Action::RESERVE) {
        mutation.set_reserve(value.size());
    } else {
        mutation.set_remove();
    }

    auto root = mutation.run(m_root);
    if (!root.has_value()) {
        mutation.abandon();
        return root.error();
    }
    mutation.commit(*m_freed);
    m_root = *root;
    old = std::move(mutation.old_value());
    if (reserved)
        *reserved = std::move(mutation.reserved());
    return Status::ok();
}

auto BTreeMut::pop_first(std::optional<EntryGuards> &out) -> Status
{
    return pop_edge(true, out);
}

auto BTreeMut::pop_last(std::optional<EntryGuards> &out) -> Status
{
    return pop_edge(false, out);
}

auto BTreeMut::pop_edge(bool from_front, std::optional<EntryGuards> &out) -> Status
{
    out.reset();
    std::optional<EntryGuards> edge;
    const auto tree = as_tree();
    BIRCH_TRY_S(from_front ? tree.first(edge) : tree.last(edge));
    if (!edge)
        return Status::ok();

    // The key has to be copied: its page is retired by the removal.
    auto key = edge->key.bytes().to_string();
    edge.reset();

    std::optional<ByteGuard> value;
    BIRCH_TRY_S(remove(key, value));
    if (!value)
        return Status::logic_error("entry is missing from the tree");
    out.emplace(EntryGuards {ByteGuard::owned(std::move(key)), std::move(*value)});
    return Status::ok();
}

auto BTreeMut::drain(const ByteRange &range) -> std::unique_ptr<EntryCursor>
{
    return std::make_unique<DrainCursor>(*this, range);
}

auto BTreeMut::finalize_dirty_checksums() -> Status
{
    if (!m_root)
        return Status::ok();
    auto root = finalize(*m_store, *m_root);
    if (!root.has_value())
        return root.error();
    m_root = *root;
    return Status::ok();
}

} // namespace Birch
