#include "warpsync/version.hpp"

#ifndef WARPSYNC_VERSION
#define WARPSYNC_VERSION "0.0.0"
#endif

namespace warpsync
{

    std::string_view version() noexcept
    {
        return WARPSYNC_VERSION;
    }

} // namespace warpsync
