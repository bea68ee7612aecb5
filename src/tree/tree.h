#ifndef BIRCH_TREE_TREE_H
#define BIRCH_TREE_TREE_H

#include "birch/btree.h"
#include "node.h"

namespace Birch {

// Checksum stored for a child written since the last commit, until it is finalized.
static constexpr Checksum PLACEHOLDER_CHECKSUM {0};

[[nodiscard]] auto page_checksum(const Slice &page) -> Checksum;

/*
 * Read the node at "ptr". Committed pages must match the checksum recorded in "ptr". Pages
 * written since the last commit are still being assembled, so they are not checked.
 */
[[nodiscard]] auto read_node(PageStore &store, const RootPointer &ptr, PageHint hint) -> tl::expected<PageRef, Status>;

// Index of the child of "branch" that would hold "key".
[[nodiscard]] auto find_child(const BranchView &branch, const Slice &key, Comparator cmp) -> Size;

// Index of the first entry in "leaf" not less than "key".
[[nodiscard]] auto find_entry(const LeafView &leaf, const Slice &key, Comparator cmp, bool &found) -> Size;

} // namespace Birch

#endif // BIRCH_TREE_TREE_H
