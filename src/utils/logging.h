#ifndef BIRCH_UTILS_LOGGING_H
#define BIRCH_UTILS_LOGGING_H

#include <string>
#include <vector>
#include "birch/page_store.h"

namespace Birch {

// Printable form of raw bytes. Other bytes are written as "\xNN".
[[nodiscard]] auto escape_string(const Slice &value) -> std::string;

// Error message about a single page, e.g. "page 12: checksum mismatch".
[[nodiscard]] auto page_message(PageNumber id, const Slice &what) -> std::string;

/*
 * Append one node of a tree dump: " [<page>| <key>[:<value>] ...]". Branch nodes pass null for
 * "values".
 */
auto append_node_summary(std::string &out, PageNumber id, const std::vector<Slice> &keys, const std::vector<Slice> *values) -> void;

// Start a line of a tree dump for the nodes at "depth".
auto append_level_label(std::string &out, Size depth) -> void;

} // namespace Birch

#endif // BIRCH_UTILS_LOGGING_H
