#pragma once

#include <string>

namespace tierstage
{

    // Strips leading and trailing spaces, tabs and line breaks.
    std::string trim(const std::string &input);

} // namespace tierstage
