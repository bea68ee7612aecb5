#include <deque>
#include "tree/node.h"
#include "unit_tests.h"
#include "utils/encoding.h"

namespace Birch {

class NodeTests: public testing::Test {
public:
    static constexpr Size PAGE_SIZE {0x200};

    NodeTests()
        : buffer(PAGE_SIZE, '\x00')
    {}

    auto page() -> Span
    {
        return Span {buffer.data(), buffer.size()};
    }

    auto make_leaf(Size n) -> NodeImage
    {
        NodeImage image;
        image.type = NodeType::LEAF;
        for (Size i {}; i < n; ++i) {
            strings.emplace_back(make_key(i));
            image.keys.emplace_back(strings.back());
            strings.emplace_back(make_value(i, i % 5));
            image.values.emplace_back(strings.back());
        }
        return image;
    }

    auto make_branch(Size n) -> NodeImage
    {
        NodeImage image;
        image.type = NodeType::BRANCH;
        for (Size i {}; i < n; ++i) {
            strings.emplace_back(make_key(i * 10));
            image.keys.emplace_back(strings.back());
        }
        for (Size i {}; i <= n; ++i)
            image.children.emplace_back(RootPointer {PageNumber {100 + i}, Checksum(i * 7)});
        return image;
    }

    std::string buffer;

    // Backing storage for the slices held by images. Deque keeps references stable.
    std::deque<std::string> strings;
};

TEST_F(NodeTests, EmptyLeafHasOnlyAHeader)
{
    NodeImage image;
    ASSERT_EQ(image.encoded_size(), NODE_HEADER_SIZE);
    image.write(page());

    auto leaf = LeafView::parse(buffer);
    ASSERT_TRUE(leaf.has_value());
    ASSERT_EQ(leaf->count(), 0);
}

TEST_F(NodeTests, LeafEntriesCanBeReadBack)
{
    const auto image = make_leaf(8);
    ASSERT_LE(image.encoded_size(), PAGE_SIZE);
    image.write(page());

    auto type = read_node_type(buffer);
    ASSERT_TRUE(type.has_value());
    ASSERT_EQ(*type, NodeType::LEAF);

    auto leaf = LeafView::parse(buffer);
    ASSERT_TRUE(leaf.has_value());
    ASSERT_EQ(leaf->count(), 8);
    for (Size i {}; i < 8; ++i) {
        ASSERT_EQ(leaf->key(i).to_string(), make_key(i));
        ASSERT_EQ(leaf->value(i).to_string(), make_value(i, i % 5));
        ASSERT_EQ(Slice {buffer}.range(leaf->value_offset(i), leaf->value(i).size()), leaf->value(i));
    }
    ASSERT_EQ(NodeImage::from_leaf(*leaf).encoded_size(), image.encoded_size());
}

TEST_F(NodeTests, BranchKeysAndChildrenCanBeReadBack)
{
    const auto image = make_branch(5);
    image.write(page());

    auto branch = BranchView::parse(buffer);
    ASSERT_TRUE(branch.has_value());
    ASSERT_EQ(branch->key_count(), 5);
    ASSERT_EQ(branch->child_count(), 6);
    for (Size i {}; i < 5; ++i)
        ASSERT_EQ(branch->key(i).to_string(), make_key(i * 10));
    for (Size i {}; i < 6; ++i) {
        ASSERT_EQ(branch->child(i).page.value, 100 + i);
        ASSERT_EQ(branch->child(i).checksum, i * 7);
    }
    ASSERT_EQ(NodeImage::from_branch(*branch).encoded_size(), image.encoded_size());
}

TEST_F(NodeTests, ViewsRejectTheWrongNodeType)
{
    make_leaf(3).write(page());
    ASSERT_TRUE(BranchView::parse(buffer).error().is_corruption());

    make_branch(3).write(page());
    ASSERT_TRUE(LeafView::parse(buffer).error().is_corruption());
}

TEST_F(NodeTests, UnknownNodeTypeIsCorruption)
{
    buffer[0] = '\x07';
    ASSERT_TRUE(read_node_type(buffer).error().is_corruption());
    ASSERT_FALSE(LeafView::parse(buffer).has_value());
}

TEST_F(NodeTests, OversizedEntryCountIsCorruption)
{
    make_leaf(3).write(page());
    put_u16(buffer.data() + 2, 0xFFFF);
    ASSERT_TRUE(LeafView::parse(buffer).error().is_corruption());

    make_branch(3).write(page());
    put_u16(buffer.data() + 2, 0xFFFF);
    ASSERT_TRUE(BranchView::parse(buffer).error().is_corruption());
}

TEST_F(NodeTests, OutOfBoundsOffsetIsCorruption)
{
    make_leaf(3).write(page());
    // Last value end offset.
    put_u16(buffer.data() + NODE_HEADER_SIZE + 5 * OFFSET_SIZE, static_cast<std::uint16_t>(PAGE_SIZE + 1));
    ASSERT_TRUE(LeafView::parse(buffer).error().is_corruption());
}

TEST_F(NodeTests, NullChildIsCorruption)
{
    make_branch(2).write(page());
    put_u64(buffer.data() + BranchView::child_offset(1), 0);
    ASSERT_TRUE(BranchView::parse(buffer).error().is_corruption());
}

TEST_F(NodeTests, LeafSplitKeepsSeparatorOnTheLeft)
{
    const auto image = make_leaf(20);
    std::vector<NodeImage> pieces;
    std::vector<Slice> separators;
    split_image(image, 2, pieces, separators);

    ASSERT_EQ(pieces.size(), 2);
    ASSERT_EQ(separators.size(), 1);
    ASSERT_FALSE(pieces[0].keys.empty());
    ASSERT_FALSE(pieces[1].keys.empty());
    ASSERT_EQ(pieces[0].keys.size() + pieces[1].keys.size(), 20);
    ASSERT_EQ(separators[0], pieces[0].keys.back());
    ASSERT_LT(separators[0], pieces[1].keys.front());
    ASSERT_EQ(pieces[0].values.size(), pieces[0].keys.size());
}

TEST_F(NodeTests, LeafSplitBalancesSize)
{
    const auto image = make_leaf(30);
    std::vector<NodeImage> pieces;
    std::vector<Slice> separators;
    split_image(image, 3, pieces, separators);

    ASSERT_EQ(pieces.size(), 3);
    ASSERT_EQ(separators.size(), 2);
    Size total {};
    for (const auto &piece: pieces) {
        total += piece.keys.size();
        ASSERT_LE(piece.encoded_size(), image.encoded_size() / 2);
    }
    ASSERT_EQ(total, 30);
}

TEST_F(NodeTests, BranchSplitPromotesSeparator)
{
    const auto image = make_branch(9);
    std::vector<NodeImage> pieces;
    std::vector<Slice> separators;
    split_image(image, 2, pieces, separators);

    ASSERT_EQ(pieces.size(), 2);
    ASSERT_EQ(separators.size(), 1);
    ASSERT_EQ(pieces[0].keys.size() + pieces[1].keys.size() + 1, 9);
    ASSERT_EQ(pieces[0].children.size() + pieces[1].children.size(), 10);
    for (const auto &piece: pieces)
        ASSERT_EQ(piece.keys.size() + 1, piece.children.size());
    ASSERT_LT(pieces[0].keys.back(), separators[0]);
    ASSERT_LT(separators[0], pieces[1].keys.front());
}

TEST_F(NodeTests, MergeConcatenatesSiblings)
{
    const auto leaf = make_leaf(10);
    std::vector<NodeImage> pieces;
    std::vector<Slice> separators;
    split_image(leaf, 2, pieces, separators);

    const auto merged = merge_images(pieces[0], separators[0], pieces[1]);
    ASSERT_EQ(merged.keys, leaf.keys);
    ASSERT_EQ(merged.values, leaf.values);

    const auto branch = make_branch(7);
    split_image(branch, 2, pieces, separators);
    const auto rejoined = merge_images(pieces[0], separators[0], pieces[1]);
    ASSERT_EQ(rejoined.keys, branch.keys);
    ASSERT_EQ(rejoined.children.size(), branch.children.size());
}

TEST(NodeSizeTests, EntryLimitScalesWithPageSize)
{
    ASSERT_EQ(max_entry_size(0x200), 0x200 / 4 - 32);
    ASSERT_EQ(max_entry_size(0x2000), 0x2000 / 4 - 32);
    ASSERT_EQ(min_node_size(0x200), 0x80);
}

#ifndef NDEBUG
TEST(NodeSizeTests, EntryLimitRequiresAUsablePageSize)
{
    ASSERT_DEATH((void)max_entry_size(0x40), "");
}
#endif // NDEBUG

} // namespace Birch
