#ifndef BIRCH_OPTIONS_H
#define BIRCH_OPTIONS_H

#include <string>
#include "common.h"

namespace Birch {

class PageStore;

static constexpr Size MINIMUM_PAGE_SIZE {0x200};
static constexpr Size DEFAULT_PAGE_SIZE {0x2000};
static constexpr Size MAXIMUM_PAGE_SIZE {0x8000};
static constexpr Size MINIMUM_LOG_MAX_SIZE {0xA000};
static constexpr Size DEFAULT_MAX_LOG_SIZE {0x100000};
static constexpr Size MAXIMUM_LOG_MAX_SIZE {0xA00000};
static constexpr Size MINIMUM_LOG_MAX_FILES {1};
static constexpr Size DEFAULT_MAX_LOG_FILES {4};
static constexpr Size MAXIMUM_LOG_MAX_FILES {32};

enum class LogLevel {
    TRACE,
    INFO,
    WARN,
    ERROR,
    OFF,
};

enum class LogTarget {
    FILE,
    STDOUT,
    STDERR,
    STDOUT_COLOR,
    STDERR_COLOR,
};

struct Options {
    Size page_size {DEFAULT_PAGE_SIZE};
    Size max_log_size {DEFAULT_MAX_LOG_SIZE};
    Size max_log_files {DEFAULT_MAX_LOG_FILES};
    LogLevel log_level {LogLevel::OFF};
    LogTarget log_target {};
    std::string log_path {"birch-log"};

    // Externally-owned page store. If null, the database creates an in-memory store.
    PageStore *store {};
};

} // namespace Birch

#endif // BIRCH_OPTIONS_H
