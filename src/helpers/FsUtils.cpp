#include "FsUtils.hpp"

#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>

bool NFsUtils::isAbsolute(const std::string& path) {
    return !path.empty() && (path.front() == '/' || path.front() == '~');
}

std::expected<std::string, std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        return std::unexpected(std::string{std::strerror(errno)});

    std::stringstream ss;
    ss << file.rdbuf();

    if (file.bad())
        return std::unexpected("read error");

    auto contents = ss.str();
    if (!contents.empty() && contents.back() == '\n')
        contents.pop_back();

    return contents;
}
