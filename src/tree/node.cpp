#include "node.h"
#include <cstring>
#include <fmt/format.h>
#include "birch/btree.h"
#include "birch/options.h"
#include "utils/encoding.h"
#include "utils/expect.h"

namespace Birch {

auto max_entry_size(Size page_size) -> Size
{
    // Keeps both halves of a split node, and both halves of a redistributed pair, within
    // [min_node_size(), page_size].
    BIRCH_EXPECT_GE(page_size, MINIMUM_PAGE_SIZE);
    return page_size / 4 - 32;
}

auto read_node_type(const Slice &page) -> tl::expected<NodeType, Status>
{
    if (page.size() < NODE_HEADER_SIZE)
        return tl::make_unexpected(Status::corruption("page is too small to hold a node"));
    const auto type = static_cast<NodeType>(page[0]);
    if (type != NodeType::LEAF && type != NodeType::BRANCH)
        return tl::make_unexpected(Status::corruption(fmt::format("node type {} is not recognized", static_cast<std::uint8_t>(page[0]))));
    return type;
}

static auto check_offsets(const Slice &page, Size begin, Size count, Size start) -> tl::expected<Size, Status>
{
    auto prev = start;
    for (Size i {}; i < count; ++i) {
        const Size end = get_u16(page.data() + begin + i * OFFSET_SIZE);
        if (end < prev || end > page.size())
            return tl::make_unexpected(Status::corruption("node offset is out of bounds"));
        prev = end;
    }
    return prev;
}

auto LeafView::parse(const Slice &page) -> tl::expected<LeafView, Status>
{
    BIRCH_NEW_R(type, read_node_type(page));
    if (type != NodeType::LEAF)
        return tl::make_unexpected(Status::corruption("expected a leaf node"));

    const Size count = get_u16(page.data() + 2);
    const auto header_end = NODE_HEADER_SIZE + 2 * count * OFFSET_SIZE;
    if (header_end > page.size())
        return tl::make_unexpected(Status::corruption("leaf entry count is too large"));

    BIRCH_NEW_R(keys_end, check_offsets(page, NODE_HEADER_SIZE, count, header_end));
    BIRCH_TRY_R(check_offsets(page, NODE_HEADER_SIZE + count * OFFSET_SIZE, count, keys_end));
    return LeafView {page, count};
}

auto LeafView::key_end(Size index) const -> Size
{
    return get_u16(m_page.data() + NODE_HEADER_SIZE + index * OFFSET_SIZE);
}

auto LeafView::value_end(Size index) const -> Size
{
    return get_u16(m_page.data() + NODE_HEADER_SIZE + (m_count + index) * OFFSET_SIZE);
}

auto LeafView::key_offset(Size index) const -> Size
{
    BIRCH_EXPECT_LT(index, m_count);
    return index ? key_end(index - 1) : NODE_HEADER_SIZE + 2 * m_count * OFFSET_SIZE;
}

auto LeafView::key(Size index) const -> Slice
{
    const auto offset = key_offset(index);
    return m_page.range(offset, key_end(index) - offset);
}

auto LeafView::value_offset(Size index) const -> Size
{
    BIRCH_EXPECT_LT(index, m_count);
    return index ? value_end(index - 1) : key_end(m_count - 1);
}

auto LeafView::value(Size index) const -> Slice
{
    const auto offset = value_offset(index);
    return m_page.range(offset, value_end(index) - offset);
}

auto BranchView::parse(const Slice &page) -> tl::expected<BranchView, Status>
{
    BIRCH_NEW_R(type, read_node_type(page));
    if (type != NodeType::BRANCH)
        return tl::make_unexpected(Status::corruption("expected a branch node"));

    const Size count = get_u16(page.data() + 2);
    const auto offsets_begin = child_offset(count + 1);
    const auto header_end = offsets_begin + count * OFFSET_SIZE;
    if (header_end > page.size())
        return tl::make_unexpected(Status::corruption("branch key count is too large"));

    for (Size i {}; i <= count; ++i) {
        if (get_u64(page.data() + child_offset(i)) == 0)
            return tl::make_unexpected(Status::corruption("branch node has a null child"));
    }
    BIRCH_TRY_R(check_offsets(page, offsets_begin, count, header_end));
    return BranchView {page, count};
}

auto BranchView::key_end(Size index) const -> Size
{
    return get_u16(m_page.data() + child_offset(m_count + 1) + index * OFFSET_SIZE);
}

auto BranchView::key(Size index) const -> Slice
{
    BIRCH_EXPECT_LT(index, m_count);
    const auto offset = index ? key_end(index - 1) : child_offset(m_count + 1) + m_count * OFFSET_SIZE;
    return m_page.range(offset, key_end(index) - offset);
}

auto BranchView::child(Size index) const -> RootPointer
{
    BIRCH_EXPECT_LE(index, m_count);
    const auto *ptr = m_page.data() + child_offset(index);
    return RootPointer {PageNumber {get_u64(ptr)}, get_u32(ptr + sizeof(std::uint64_t))};
}

auto NodeImage::from_leaf(const LeafView &leaf) -> NodeImage
{
    NodeImage image;
    image.type = NodeType::LEAF;
    image.keys.reserve(leaf.count());
    image.values.reserve(leaf.count());
    for (Size i {}; i < leaf.count(); ++i) {
        image.keys.emplace_back(leaf.key(i));
        image.values.emplace_back(leaf.value(i));
    }
    return image;
}

auto NodeImage::from_branch(const BranchView &branch) -> NodeImage
{
    NodeImage image;
    image.type = NodeType::BRANCH;
    image.keys.reserve(branch.key_count());
    image.children.reserve(branch.child_count());
    for (Size i {}; i < branch.key_count(); ++i)
        image.keys.emplace_back(branch.key(i));
    for (Size i {}; i < branch.child_count(); ++i)
        image.children.emplace_back(branch.child(i));
    return image;
}

auto NodeImage::encoded_size() const -> Size
{
    Size total {NODE_HEADER_SIZE};
    for (const auto &key: keys)
        total += key.size() + OFFSET_SIZE;
    if (is_leaf()) {
        for (const auto &value: values)
            total += value.size() + OFFSET_SIZE;
    } else {
        total += children.size() * CHILD_REF_SIZE;
    }
    return total;
}

auto NodeImage::write(Span out) const -> void
{
    BIRCH_EXPECT_LE(encoded_size(), out.size());
    BIRCH_EXPECT_TRUE(is_leaf() ? keys.size() == values.size() : keys.size() + 1 == children.size());

    auto *data = out.data();
    data[0] = static_cast<Byte>(type);
    data[1] = 0;
    put_u16(data + 2, static_cast<std::uint16_t>(keys.size()));

    Size offsets {NODE_HEADER_SIZE};
    if (!is_leaf()) {
        for (Size i {}; i < children.size(); ++i) {
            auto *ptr = data + BranchView::child_offset(i);
            put_u64(ptr, children[i].page.value);
            put_u32(ptr + sizeof(std::uint64_t), children[i].checksum);
        }
        offsets = BranchView::child_offset(children.size());
    }

    const auto append = [data, &offsets](const std::vector<Slice> &items, Size &position) {
        for (const auto &item: items) {
            if (!item.is_empty())
                std::memcpy(data + position, item.data(), item.size());
            position += item.size();
            put_u16(data + offsets, static_cast<std::uint16_t>(position));
            offsets += OFFSET_SIZE;
        }
    };

    auto position = offsets + (keys.size() + values.size()) * OFFSET_SIZE;
    append(keys, position);
    append(values, position);
}

auto split_image(const NodeImage &image, Size pieces, std::vector<NodeImage> &out, std::vector<Slice> &separators) -> void
{
    const auto units = image.is_leaf() ? image.keys.size() : image.children.size();
    BIRCH_EXPECT_GE(pieces, 2);
    BIRCH_EXPECT_GE(units, pieces);

    std::vector<Size> prefix(units + 1);
    for (Size j {}; j < units; ++j) {
        Size cost;
        if (image.is_leaf()) {
            cost = 2 * OFFSET_SIZE + image.keys[j].size() + image.values[j].size();
        } else {
            cost = CHILD_REF_SIZE;
            if (j < image.keys.size())
                cost += OFFSET_SIZE + image.keys[j].size();
        }
        prefix[j + 1] = prefix[j] + cost;
    }

    // Each piece ends at the unit boundary closest to its share of the total.
    std::vector<Size> ends;
    Size start {};
    for (Size p {1}; p < pieces; ++p) {
        const auto target = prefix[units] * p / pieces;
        const auto limit = units - (pieces - p);
        auto end = start + 1;
        while (end < limit && prefix[end] < target)
            ++end;
        if (end - 1 > start && prefix[end] >= target && target - prefix[end - 1] < prefix[end] - target)
            --end;
        ends.emplace_back(end);
        start = end;
    }
    ends.emplace_back(units);

    out.clear();
    separators.clear();
    start = 0;
    for (Size p {}; p < pieces; ++p) {
        const auto end = ends[p];
        NodeImage piece;
        piece.type = image.type;
        if (image.is_leaf()) {
            piece.keys.assign(begin(image.keys) + long(start), begin(image.keys) + long(end));
            piece.values.assign(begin(image.values) + long(start), begin(image.values) + long(end));
            if (p + 1 < pieces)
                separators.emplace_back(image.keys[end - 1]);
        } else {
            piece.children.assign(begin(image.children) + long(start), begin(image.children) + long(end));
            piece.keys.assign(begin(image.keys) + long(start), begin(image.keys) + long(end - 1));
            if (p + 1 < pieces)
                separators.emplace_back(image.keys[end - 1]);
        }
        out.emplace_back(std::move(piece));
        start = end;
    }
}

auto merge_images(const NodeImage &left, const Slice &separator, const NodeImage &right) -> NodeImage
{
    BIRCH_EXPECT_EQ(left.type, right.type);
    auto merged = left;
    if (!left.is_leaf())
        merged.keys.emplace_back(separator);
    merged.keys.insert(end(merged.keys), begin(right.keys), end(right.keys));
    merged.values.insert(end(merged.values), begin(right.values), end(right.values));
    merged.children.insert(end(merged.children), begin(right.children), end(right.children));
    return merged;
}

} // namespace Birch
