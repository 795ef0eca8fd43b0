#pragma once

#include <string>

#include <pistache/http.h>
#include <pistache/http_headers.h>

#include "../core/HeaderMap.hpp"
#include "../core/Resolver.hpp"

namespace NRequestUtils {
    CHeaderMap           headersForRequest(const Pistache::Http::Request& req);
    // one entry per header line pistache kept, in name order
    CHeaderMap           headersForCollection(const Pistache::Http::Header::Collection& collection);
    // fresh state from the transport, before any resolution
    SRequestAddressState stateForRequest(const Pistache::Http::Request& req, const CHeaderMap& headers);
};
