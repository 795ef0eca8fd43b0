#include "RequestUtils.hpp"

#include <algorithm>

CHeaderMap NRequestUtils::headersForRequest(const Pistache::Http::Request& req) {
    return headersForCollection(req.headers());
}

CHeaderMap NRequestUtils::headersForCollection(const Pistache::Http::Header::Collection& collection) {
    // pistache keeps a raw copy of every header, typed ones included, keyed by name.
    // wire order is gone by now, sort so the map is at least stable.
    std::vector<Pistache::Http::Header::Raw> raw;
    for (const auto& [name, h] : collection.rawList()) {
        raw.emplace_back(h);
    }

    std::sort(raw.begin(), raw.end(), [](const auto& a, const auto& b) { return a.name() < b.name(); });

    CHeaderMap headers;
    for (const auto& h : raw) {
        headers.add(h.name(), h.value());
    }

    return headers;
}

SRequestAddressState NRequestUtils::stateForRequest(const Pistache::Http::Request& req, const CHeaderMap& headers) {
    SRequestAddressState state;

    state.peerAddress   = req.address().host();
    state.remoteAddress = state.peerAddress;
    state.scheme        = "http";
    state.host          = headers.get("Host").value_or("");

    return state;
}
