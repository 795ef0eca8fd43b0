#pragma once

#include <string_view>

#include "../core/HeaderMap.hpp"

namespace NHttpUtils {
    // RFC 7230 6.1 connection-scoped headers, plus Proxy-Connection
    bool   isHopByHopHeader(const std::string_view& name);

    // removes hop-by-hop headers and every header listed in Connection, returns how many were removed
    size_t stripHopByHopHeaders(CHeaderMap& headers);
};
