#include "harness.h"
#include "utils/utils.h"

namespace Birch {

auto check_status(const char *expr, const Status &s) -> testing::AssertionResult
{
    if (s.is_ok())
        return testing::AssertionSuccess();
    return testing::AssertionFailure() << expr << ": " << get_status_name(s) << ": " << s.what().to_string();
}

} // namespace Birch
