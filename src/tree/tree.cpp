#include "tree.h"
#include "utils/crc.h"
#include "utils/expect.h"
#include "utils/logging.h"

namespace Birch {

auto page_checksum(const Slice &page) -> Checksum
{
    return crc_32(page);
}

auto read_node(PageStore &store, const RootPointer &ptr, PageHint hint) -> tl::expected<PageRef, Status>
{
    PageRef page;
    if (auto s = store.read_page(ptr.page, hint, page); !s.is_ok())
        return tl::make_unexpected(s);

    if (!store.is_uncommitted(ptr.page) && page_checksum(page->data()) != ptr.checksum)
        return tl::make_unexpected(Status::corruption(page_message(ptr.page, "checksum mismatch")));
    return page;
}

auto find_child(const BranchView &branch, const Slice &key, Comparator cmp) -> Size
{
    Size lower {};
    auto upper = branch.key_count();
    while (lower < upper) {
        const auto middle = (lower + upper) / 2;
        if (cmp(key, branch.key(middle)) == ThreeWayComparison::GT) {
            lower = middle + 1;
        } else {
            upper = middle;
        }
    }
    return lower;
}

auto find_entry(const LeafView &leaf, const Slice &key, Comparator cmp, bool &found) -> Size
{
    Size lower {};
    auto upper = leaf.count();
    while (lower < upper) {
        const auto middle = (lower + upper) / 2;
        if (cmp(key, leaf.key(middle)) == ThreeWayComparison::GT) {
            lower = middle + 1;
        } else {
            upper = middle;
        }
    }
    found = lower < leaf.count() && cmp(key, leaf.key(lower)) == ThreeWayComparison::EQ;
    return lower;
}

} // namespace Birch
