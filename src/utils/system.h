#ifndef BIRCH_UTILS_SYSTEM_H
#define BIRCH_UTILS_SYSTEM_H

#include <memory>
#include <spdlog/spdlog.h>
#include "birch/options.h"

namespace Birch {

using Log = spdlog::logger;
using LogPtr = std::shared_ptr<spdlog::logger>;
using LogSink = spdlog::sink_ptr;

/*
 * Owns the log sink shared by every component of a database.
 */
class System {
public:
    explicit System(const Options &options);
    [[nodiscard]] auto create_log(const std::string &name) const -> LogPtr;

private:
    LogSink m_sink;
};

} // namespace Birch

#endif // BIRCH_UTILS_SYSTEM_H
