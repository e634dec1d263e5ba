#include "tierstage/string_util.hpp"

namespace tierstage
{

    namespace
    {
        constexpr auto kWhitespace = " \t\r\n";
    } // namespace

    std::string trim(const std::string &input)
    {
        const auto begin = input.find_first_not_of(kWhitespace);
        if (begin == std::string::npos)
        {
            return "";
        }
        const auto end = input.find_last_not_of(kWhitespace);
        return input.substr(begin, end - begin + 1);
    }

} // namespace tierstage
