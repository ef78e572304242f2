#pragma once

#include <string_view>

namespace warpsync
{

    std::string_view version() noexcept;

} // namespace warpsync
