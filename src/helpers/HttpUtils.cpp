#include "HttpUtils.hpp"

#include <array>
#include <string>
#include <vector>
#include <algorithm>

#include "StringUtils.hpp"

constexpr std::array<std::string_view, 9> HOP_BY_HOP_HEADERS = {
    "connection", "keep-alive", "proxy-authenticate", "proxy-authorization", "proxy-connection", "te", "trailer", "transfer-encoding", "upgrade",
};

bool NHttpUtils::isHopByHopHeader(const std::string_view& name) {
    return std::any_of(HOP_BY_HOP_HEADERS.begin(), HOP_BY_HOP_HEADERS.end(), [&name](const std::string_view& h) { return NStringUtils::equalsIgnoreCase(h, name); });
}

size_t NHttpUtils::stripHopByHopHeaders(CHeaderMap& headers) {
    std::vector<std::string> connectionScoped;

    for (const auto& h : headers.list()) {
        if (!NStringUtils::equalsIgnoreCase(h.name, "connection"))
            continue;

        for (const auto& token : NStringUtils::split(h.value, ',')) {
            const auto NAME = NStringUtils::trim(token);
            if (!NAME.empty())
                connectionScoped.emplace_back(NAME);
        }
    }

    size_t removed = 0;

    for (const auto& name : connectionScoped) {
        removed += headers.remove(name);
    }

    for (const auto& name : HOP_BY_HOP_HEADERS) {
        removed += headers.remove(name);
    }

    return removed;
}
