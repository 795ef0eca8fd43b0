#pragma once

#include <string>
#include <vector>
#include <optional>

#include "TrustSet.hpp"
#include "HeaderMap.hpp"
#include "../config/ConfigTypes.hpp"

struct SResolutionConfig {
    std::vector<std::string> ipHeaders;
    std::vector<std::string> schemeHeaders;
    std::vector<std::string> httpsValues;
    bool                     parseRFC7239 = true;
    bool                     hideHeaders  = false;
    bool                     enabled      = true;
};

struct SRequestAddressState {
    std::string peerAddress;
    std::string remoteAddress;
    std::string remoteProxyAddress;
    std::string scheme = "http";
    std::string host;
};

struct SResolution {
    eResolutionOutcome         outcome = RESOLUTION_PASSTHROUGH;
    eTrustResult               peerTrust = TRUST_INVALID;

    std::optional<std::string> matchedIPHeader;
    std::optional<std::string> matchedSchemeHeader;
    bool                       usedForwarded = false;

    bool                       setRemoteAddress      = false;
    bool                       setRemoteProxyAddress = false;
    bool                       setScheme             = false;
    bool                       setHost               = false;
    size_t                     headersRemoved        = 0;
};

// Decides the client address, proxy address, scheme and host of a request
// coming through a trusted proxy. Holds no per-request state, safe to share.
class CForwardingResolver {
  public:
    CForwardingResolver(SResolutionConfig config, CTrustSet trust);

    SResolution              resolve(CHeaderMap& headers, SRequestAddressState& state) const;

    eTrustResult             isTrustedSource(const std::string& address) const;
    // checks the original peer of a rewritten request, or the remote address if not rewritten
    eTrustResult             isTrustedSource(const SRequestAddressState& state) const;

    const SResolutionConfig& config() const;
    const CTrustSet&         trustSet() const;

  private:
    SResolutionConfig m_config;
    CTrustSet         m_trust;

    void              applyForwarded(const CHeaderMap& headers, SRequestAddressState& state, SResolution& result) const;
};
