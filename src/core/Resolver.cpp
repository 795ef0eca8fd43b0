#include "Resolver.hpp"
#include "Forwarded.hpp"

#include <algorithm>

#include "../debug/log.hpp"
#include "../helpers/StringUtils.hpp"

constexpr const char* FORWARDED_HEADER       = "forwarded";
constexpr const char* X_FORWARDED_FOR_HEADER = "x-forwarded-for";

static bool isValidIP(const std::string_view& ip) {
    return CIP::fromString(ip).has_value();
}

CForwardingResolver::CForwardingResolver(SResolutionConfig config, CTrustSet trust) : m_config(std::move(config)), m_trust(std::move(trust)) {
    ;
}

SResolution CForwardingResolver::resolve(CHeaderMap& headers, SRequestAddressState& state) const {
    SResolution result;
    result.peerTrust = m_trust.contains(state.peerAddress);

    if (result.peerTrust == TRUST_INVALID) {
        Debug::log(WARN, "Peer address \"{}\" is not a valid ip, not trusting it", state.peerAddress);
        return result;
    }

    if (result.peerTrust == TRUST_UNTRUSTED) {
        Debug::log(TRACE, "{} not found in trusted sources", state.peerAddress);
        return result;
    }

    result.outcome = RESOLUTION_REWRITTEN;

    // client address from vendor headers
    if (const auto IP_HEADER = headers.firstOf(m_config.ipHeaders); IP_HEADER) {
        auto ip = std::string{NStringUtils::trim(IP_HEADER->value)};

        // leftmost entry is the original client
        if (NStringUtils::equalsIgnoreCase(IP_HEADER->name, X_FORWARDED_FOR_HEADER))
            ip = std::string{NStringUtils::trim(NStringUtils::split(ip, ',').front())};

        result.matchedIPHeader = IP_HEADER->name;

        if (isValidIP(ip)) {
            Debug::log(TRACE, "Matched on ip header \"{}\" (value: \"{}\")", IP_HEADER->name, ip);

            state.remoteProxyAddress     = state.peerAddress;
            state.remoteAddress          = ip;
            result.setRemoteProxyAddress = true;
            result.setRemoteAddress      = true;
        } else
            Debug::log(TRACE, "Ip header \"{}\" has an invalid value \"{}\", ignoring", IP_HEADER->name, ip);
    }

    // scheme from vendor headers
    for (const auto& h : m_config.schemeHeaders) {
        const auto VALUE = headers.get(h);

        if (!VALUE)
            continue;

        const auto SCHEME = NStringUtils::trim(*VALUE);
        if (SCHEME.empty())
            continue;

        const bool HTTPS = std::any_of(m_config.httpsValues.begin(), m_config.httpsValues.end(), [&SCHEME](const std::string& v) { return NStringUtils::equalsIgnoreCase(v, SCHEME); });

        if (!HTTPS) {
            Debug::log(TRACE, "Scheme header \"{}\" (value: \"{}\") is not an https value", h, SCHEME);
            continue;
        }

        Debug::log(TRACE, "Matched on https header \"{}\" (value: \"{}\")", h, SCHEME);

        state.scheme               = "https";
        result.setScheme           = true;
        result.matchedSchemeHeader = h;
        break;
    }

    if (m_config.parseRFC7239)
        applyForwarded(headers, state, result);

    if (m_config.hideHeaders) {
        for (const auto& h : m_config.ipHeaders) {
            result.headersRemoved += headers.remove(h);
        }

        for (const auto& h : m_config.schemeHeaders) {
            result.headersRemoved += headers.remove(h);
        }

        result.headersRemoved += headers.remove(FORWARDED_HEADER);

        Debug::log(TRACE, "Removed {} forwarding headers from request", result.headersRemoved);
    }

    return result;
}

void CForwardingResolver::applyForwarded(const CHeaderMap& headers, SRequestAddressState& state, SResolution& result) const {
    const auto FORWARDED = headers.get(FORWARDED_HEADER);

    if (!FORWARDED)
        return;

    const auto ELEMENT = NForwarded::parseFirstElement(*FORWARDED);

    if (!ELEMENT) {
        Debug::log(TRACE, "Malformed Forwarded header \"{}\", ignoring", *FORWARDED);
        return;
    }

    result.usedForwarded = true;

    bool forApplied = false;
    bool byApplied  = false;

    if (ELEMENT->forNode) {
        const auto FOR = NForwarded::nodeAddress(*ELEMENT->forNode);

        if (isValidIP(FOR)) {
            Debug::log(TRACE, "Forwarded for={}", FOR);
            state.remoteAddress     = FOR;
            result.setRemoteAddress = true;
            forApplied              = true;
        } else
            Debug::log(TRACE, "Forwarded for node \"{}\" is not an ip, ignoring", *ELEMENT->forNode);
    }

    if (ELEMENT->byNode) {
        const auto BY = NForwarded::nodeAddress(*ELEMENT->byNode);

        if (isValidIP(BY)) {
            Debug::log(TRACE, "Forwarded by={}", BY);
            state.remoteProxyAddress     = BY;
            result.setRemoteProxyAddress = true;
            byApplied                    = true;
        } else
            Debug::log(TRACE, "Forwarded by node \"{}\" is not an ip, ignoring", *ELEMENT->byNode);
    }

    // without a usable by, the proxy is whoever sent us the header
    if (forApplied && !byApplied && !result.setRemoteProxyAddress) {
        state.remoteProxyAddress     = state.peerAddress;
        result.setRemoteProxyAddress = true;
    }

    if (ELEMENT->proto) {
        state.scheme     = *ELEMENT->proto;
        result.setScheme = true;
    }

    if (ELEMENT->host) {
        state.host     = *ELEMENT->host;
        result.setHost = true;
    }
}

eTrustResult CForwardingResolver::isTrustedSource(const std::string& address) const {
    return m_trust.contains(address);
}

eTrustResult CForwardingResolver::isTrustedSource(const SRequestAddressState& state) const {
    return m_trust.contains(state.remoteProxyAddress.empty() ? state.remoteAddress : state.remoteProxyAddress);
}

const SResolutionConfig& CForwardingResolver::config() const {
    return m_config;
}

const CTrustSet& CForwardingResolver::trustSet() const {
    return m_trust;
}
