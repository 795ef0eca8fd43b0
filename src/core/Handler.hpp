#pragma once

#include <pistache/http.h>
#include <pistache/client.h>

#include <memory>
#include <optional>

#include "Resolver.hpp"

class CServerHandler : public Pistache::Http::Handler {

    HTTP_PROTOTYPE(CServerHandler)

  public:
    CServerHandler(std::shared_ptr<const CForwardingResolver> resolver);

    void onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response);

    void onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response);

  private:
    void serveWhoami(const SRequestAddressState& state, eResolutionOutcome outcome, Pistache::Http::ResponseWriter& response);
    void proxyPass(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response, CHeaderMap& headers, const SRequestAddressState& state);

    void copyUpstreamResponse(const Pistache::Http::Response& upstream, Pistache::Http::ResponseWriter& response);

    struct SWhoamiResponse {
        std::string         remote_address;
        std::string         remote_proxy_address;
        std::string         scheme;
        std::string         host;
        std::string         peer_address;
        std::string         outcome;
        std::optional<bool> is_trusted_source;
        std::optional<bool> is_peer_trusted;
    };

    std::shared_ptr<const CForwardingResolver> m_resolver;
};
