#ifndef BIRCH_UTILS_H
#define BIRCH_UTILS_H

#include "expect.h"
#include "birch/options.h"

namespace Birch {

// Source: http://graphics.stanford.edu/~seander/bithacks.html#DetermineIfPowerOf2
template<class T>
constexpr auto is_power_of_two(T v) noexcept -> bool
{
    return v && !(v & (v - 1));
}

[[nodiscard]]
inline auto get_status_name(const Status &s) noexcept -> const char *
{
    if (s.is_not_found()) {
        return "not found";
    } else if (s.is_system_error()) {
        return "system error";
    } else if (s.is_logic_error()) {
        return "logic error";
    } else if (s.is_corruption()) {
        return "corruption";
    } else if (s.is_invalid_argument()) {
        return "invalid argument";
    } else if (s.is_table_already_open()) {
        return "table already open";
    } else if (s.is_type_mismatch()) {
        return "type mismatch";
    }
    BIRCH_EXPECT_TRUE(s.is_ok());
    return "ok";
}

/*
 * Check the options that cannot be fixed up silently.
 */
[[nodiscard]]
inline auto validate_options(const Options &options) -> Status
{
    if (options.page_size < MINIMUM_PAGE_SIZE)
        return Status::invalid_argument("page size is too small");
    if (options.page_size > MAXIMUM_PAGE_SIZE)
        return Status::invalid_argument("page size is too large");
    if (!is_power_of_two(options.page_size))
        return Status::invalid_argument("page size is not a power of 2");
    if (options.log_level != LogLevel::OFF && options.log_target == LogTarget::FILE) {
        if (options.log_path.empty())
            return Status::invalid_argument("log path is empty");
        if (options.max_log_size < MINIMUM_LOG_MAX_SIZE || options.max_log_size > MAXIMUM_LOG_MAX_SIZE)
            return Status::invalid_argument("max log size is out of range");
        if (options.max_log_files < MINIMUM_LOG_MAX_FILES || options.max_log_files > MAXIMUM_LOG_MAX_FILES)
            return Status::invalid_argument("max log files is out of range");
    }
    return Status::ok();
}

} // namespace Birch

#endif // BIRCH_UTILS_H
