#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>

std::string NStringUtils::toLower(const std::string_view& sv) {
    std::string LC{sv};
    std::transform(LC.begin(), LC.end(), LC.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return LC;
}

bool NStringUtils::equalsIgnoreCase(const std::string_view& a, const std::string_view& b) {
    if (a.size() != b.size())
        return false;

    return std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) { return std::tolower((unsigned char)l) == std::tolower((unsigned char)r); });
}

std::string_view NStringUtils::trim(const std::string_view& sv) {
    const auto BEGIN = sv.find_first_not_of(" \t");
    if (BEGIN == std::string_view::npos)
        return {};

    const auto END = sv.find_last_not_of(" \t");
    return sv.substr(BEGIN, END - BEGIN + 1);
}

std::vector<std::string_view> NStringUtils::split(const std::string_view& sv, char delim) {
    std::vector<std::string_view> result;

    size_t                        lastPos = 0;
    while (true) {
        const auto POS = sv.find(delim, lastPos);

        if (POS == std::string_view::npos) {
            result.emplace_back(sv.substr(lastPos));
            break;
        }

        result.emplace_back(sv.substr(lastPos, POS - lastPos));
        lastPos = POS + 1;
    }

    return result;
}
