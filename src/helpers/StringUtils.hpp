#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace NStringUtils {
    std::string                   toLower(const std::string_view& sv);
    bool                          equalsIgnoreCase(const std::string_view& a, const std::string_view& b);
    std::string_view              trim(const std::string_view& sv);
    std::vector<std::string_view> split(const std::string_view& sv, char delim);
};
