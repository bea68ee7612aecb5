#ifndef BIRCH_TREE_NODE_H
#define BIRCH_TREE_NODE_H

#include <vector>
#include <tl/expected.hpp>
#include "birch/page_store.h"
#include "birch/status.h"

namespace Birch {

enum class NodeType : Byte {
    LEAF = 1,
    BRANCH = 2,
};

static constexpr Size NODE_HEADER_SIZE {4};
static constexpr Size CHILD_REF_SIZE {sizeof(std::uint64_t) + sizeof(Checksum)};
static constexpr Size OFFSET_SIZE {sizeof(std::uint16_t)};

/* Leaf Node Format:
 *     Offset      Size    Name
 *    ---------------------------------
 *     0           1       Node type (1)
 *     1           1       Unused
 *     2           2       Entry count (N)
 *     4           2N      Key end offsets
 *     4+2N        2N      Value end offsets
 *     4+4N        *       Keys, packed in order
 *     *           *       Values, packed in order
 *
 * Offsets are measured from the start of the page. Key i begins where key i-1 ends, and value 0
 * begins where the last key ends.
 */
class LeafView final {
public:
    [[nodiscard]] static auto parse(const Slice &page) -> tl::expected<LeafView, Status>;

    [[nodiscard]] auto count() const -> Size
    {
        return m_count;
    }

    [[nodiscard]] auto key_offset(Size index) const -> Size;
    [[nodiscard]] auto key(Size index) const -> Slice;
    [[nodiscard]] auto value_offset(Size index) const -> Size;
    [[nodiscard]] auto value(Size index) const -> Slice;

private:
    LeafView(const Slice &page, Size count)
        : m_page {page},
          m_count {count}
    {}

    [[nodiscard]] auto key_end(Size index) const -> Size;
    [[nodiscard]] auto value_end(Size index) const -> Size;

    Slice m_page;
    Size m_count {};
};

/* Branch Node Format:
 *     Offset      Size    Name
 *    ---------------------------------
 *     0           1       Node type (2)
 *     1           1       Unused
 *     2           2       Key count (N)
 *     4           12N+12  Child references: (page number, checksum) x (N+1)
 *     16+12N      2N      Key end offsets
 *     16+14N      *       Keys, packed in order
 *
 * Key i is an upper bound (inclusive) on the keys stored under child i. Child N holds the keys
 * greater than key N-1.
 */
class BranchView final {
public:
    [[nodiscard]] static auto parse(const Slice &page) -> tl::expected<BranchView, Status>;

    [[nodiscard]] auto key_count() const -> Size
    {
        return m_count;
    }

    [[nodiscard]] auto child_count() const -> Size
    {
        return m_count + 1;
    }

    [[nodiscard]] auto key(Size index) const -> Slice;
    [[nodiscard]] auto child(Size index) const -> RootPointer;

    // Offset of a child reference within the page.
    [[nodiscard]] static auto child_offset(Size index) -> Size
    {
        return NODE_HEADER_SIZE + index * CHILD_REF_SIZE;
    }

private:
    BranchView(const Slice &page, Size count)
        : m_page {page},
          m_count {count}
    {}

    [[nodiscard]] auto key_end(Size index) const -> Size;

    Slice m_page;
    Size m_count {};
};

[[nodiscard]] auto read_node_type(const Slice &page) -> tl::expected<NodeType, Status>;

/*
 * Contents of a node that has not been written to a page yet. The slices borrow from pages and
 * buffers that the caller keeps alive until the image is written.
 */
struct NodeImage {
    NodeType type {NodeType::LEAF};
    std::vector<Slice> keys;
    std::vector<Slice> values;
    std::vector<RootPointer> children;

    [[nodiscard]] static auto from_leaf(const LeafView &leaf) -> NodeImage;
    [[nodiscard]] static auto from_branch(const BranchView &branch) -> NodeImage;

    [[nodiscard]] auto is_leaf() const -> bool
    {
        return type == NodeType::LEAF;
    }

    [[nodiscard]] auto encoded_size() const -> Size;

    // Write the node to the start of "out". The node must fit.
    auto write(Span out) const -> void;
};

/*
 * Split an image into "pieces" nodes of about the same encoded size. Leaf pieces are separated by
 * the last key of the left piece, which stays in the leaf. Branch pieces are separated by the key
 * between them, which moves up to the parent.
 */
auto split_image(const NodeImage &image, Size pieces, std::vector<NodeImage> &out, std::vector<Slice> &separators) -> void;

/*
 * Concatenate two sibling images. "separator" is the parent key between them, and is only used
 * for branches.
 */
[[nodiscard]] auto merge_images(const NodeImage &left, const Slice &separator, const NodeImage &right) -> NodeImage;

[[nodiscard]] inline auto min_node_size(Size page_size) -> Size
{
    return page_size / 4;
}

} // namespace Birch

#endif // BIRCH_TREE_NODE_H
