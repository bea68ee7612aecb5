#include "logging.h"
#include <iterator>
#include <fmt/format.h>
#include "expect.h"

namespace Birch {

static auto append_escaped(fmt::memory_buffer &buffer, const Slice &value) -> void
{
    for (Size i {}; i < value.size(); ++i) {
        const auto chr = static_cast<std::uint8_t>(value[i]);
        if (chr >= ' ' && chr <= '~') {
            buffer.push_back(static_cast<char>(chr));
        } else {
            fmt::format_to(std::back_inserter(buffer), "\\x{:02x}", chr);
        }
    }
}

auto escape_string(const Slice &value) -> std::string
{
    fmt::memory_buffer buffer;
    append_escaped(buffer, value);
    return fmt::to_string(buffer);
}

auto page_message(PageNumber id, const Slice &what) -> std::string
{
    return fmt::format("page {}: {}", id.value, std::string_view {what.data(), what.size()});
}

auto append_node_summary(std::string &out, PageNumber id, const std::vector<Slice> &keys, const std::vector<Slice> *values) -> void
{
    BIRCH_EXPECT_TRUE(values == nullptr || values->size() == keys.size());

    fmt::memory_buffer buffer;
    fmt::format_to(std::back_inserter(buffer), " [{}|", id.value);
    for (Size i {}; i < keys.size(); ++i) {
        buffer.push_back(' ');
        append_escaped(buffer, keys[i]);
        if (values) {
            buffer.push_back(':');
            append_escaped(buffer, (*values)[i]);
        }
    }
    buffer.push_back(']');
    out.append(buffer.data(), buffer.size());
}

auto append_level_label(std::string &out, Size depth) -> void
{
    out += fmt::format("{}:", depth);
}

} // namespace Birch
