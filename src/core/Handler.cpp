#include "Handler.hpp"
#include "../headers/passthroughHeader.hpp"
#include "../debug/log.hpp"
#include "../config/Config.hpp"
#include "../helpers/RequestUtils.hpp"
#include "../helpers/StringUtils.hpp"
#include "../helpers/HttpUtils.hpp"
#include "../logging/TrafficLogger.hpp"

#include <sstream>
#include <condition_variable>
#include <atomic>

#include <glaze/glaze.hpp>

constexpr const char* WHOAMI_RESOURCE = "/trustgate/whoami";

static std::optional<bool> trustToOptional(eTrustResult r) {
    switch (r) {
        case TRUST_TRUSTED: return true;
        case TRUST_UNTRUSTED: return false;
        case TRUST_INVALID: return std::nullopt;
    }

    return std::nullopt;
}

CServerHandler::CServerHandler(std::shared_ptr<const CForwardingResolver> resolver) : m_resolver(resolver) {
    ;
}

void CServerHandler::onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response) {
    auto               headers = NRequestUtils::headersForRequest(req);
    auto               state   = NRequestUtils::stateForRequest(req, headers);

    eResolutionOutcome outcome = RESOLUTION_DISABLED;

    if (m_resolver->config().enabled)
        outcome = m_resolver->resolve(headers, state).outcome;

    Debug::log(LOG, "New request: {}{}", state.host, req.resource());
    Debug::log(LOG, " | Request author: IP {}, direct: {}, scheme: {} ({})", state.remoteAddress, state.peerAddress, state.scheme, outcomeToString(outcome));

    if (req.resource() == WHOAMI_RESOURCE) {
        if (req.method() == Pistache::Http::Method::Get)
            serveWhoami(state, outcome, response);
        else
            response.send(Pistache::Http::Code::Bad_Request, "Bad Request");

        g_pTrafficLogger->logTraffic(req, state, outcome);
        return;
    }

    proxyPass(req, response, headers, state);
    g_pTrafficLogger->logTraffic(req, state, outcome);
}

void CServerHandler::onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response) {
    response.send(Pistache::Http::Code::Request_Timeout, "Timeout").then([=](ssize_t) {}, PrintException());
}

void CServerHandler::serveWhoami(const SRequestAddressState& state, eResolutionOutcome outcome, Pistache::Http::ResponseWriter& response) {
    SWhoamiResponse whoami;
    whoami.remote_address       = state.remoteAddress;
    whoami.remote_proxy_address = state.remoteProxyAddress;
    whoami.scheme               = state.scheme;
    whoami.host                 = state.host;
    whoami.peer_address         = state.peerAddress;
    whoami.outcome              = outcomeToString(outcome);
    whoami.is_trusted_source    = trustToOptional(m_resolver->isTrustedSource(state));
    whoami.is_peer_trusted      = trustToOptional(m_resolver->isTrustedSource(state.peerAddress));

    auto json = glz::write_json(whoami);

    if (!json.has_value()) {
        Debug::log(ERR, "Failed to serialize whoami response");
        response.send(Pistache::Http::Code::Internal_Server_Error, "Internal Server Error");
        return;
    }

    response.setMime(Pistache::Http::Mime::MediaType("application/json"));
    response.send(Pistache::Http::Code::Ok, json.value());
}

void CServerHandler::proxyPass(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response, CHeaderMap& headers, const SRequestAddressState& state) {
    const auto& UPSTREAM = g_pConfig->m_config.upstream;

    // the upstream trusts us, tell it what we resolved
    if (!UPSTREAM.client_address_header.empty())
        headers.set(UPSTREAM.client_address_header, state.remoteAddress);
    if (!UPSTREAM.scheme_header.empty())
        headers.set(UPSTREAM.scheme_header, state.scheme);

    const std::string FORWARD_ADDRESS = g_pConfig->m_config.forward_address;

    Debug::log(TRACE, "Method ({}): Forwarding to {}", (uint32_t)req.method(), FORWARD_ADDRESS + req.resource());

    Pistache::Http::Experimental::Client client;
    client.init(Pistache::Http::Experimental::Client::options().maxConnectionsPerHost(32).maxResponseSize(g_pConfig->m_config.max_request_size).threads(4));

    auto builder = client.prepareRequest(FORWARD_ADDRESS + req.resource(), req.method());
    builder.body(req.body());
    for (auto it = req.cookies().begin(); it != req.cookies().end(); ++it) {
        builder.cookie(*it);
    }
    builder.params(req.query());

    const auto HOP_BY_HOP = NHttpUtils::stripHopByHopHeaders(headers);
    Debug::log(TRACE, "Dropped {} hop-by-hop headers", HOP_BY_HOP);

    for (const auto& h : headers.list()) {
        // the client frames the body itself
        if (NStringUtils::equalsIgnoreCase(h.name, "Content-Length"))
            continue;

        Debug::log(TRACE, "Header in: {}: {}", h.name, h.value);
        builder.header(std::make_shared<PassthroughHeader>(h.name, h.value));
    }
    builder.header(std::make_shared<Pistache::Http::Header::Connection>(Pistache::Http::ConnectionControl::KeepAlive));

    builder.timeout(std::chrono::seconds(g_pConfig->m_config.proxy_timeout_sec));

    // whichever of the upstream callbacks and the timeout comes first answers the client
    auto answered = std::make_shared<std::atomic<bool>>(false);

    auto resp = builder.send();
    resp.then(
        [&, answered](Pistache::Http::Response resp) {
            if (answered->exchange(true))
                return;

            copyUpstreamResponse(resp, response);
            response.send(resp.code(), resp.body());
        },
        [&, answered](std::exception_ptr e) {
            if (answered->exchange(true))
                return;

            try {
                std::rethrow_exception(e);
            } catch (std::exception& e) { Debug::log(ERR, "Proxy failed: {}", e.what()); } catch (const std::string& e) {
                Debug::log(ERR, "Proxy failed: {}", e);
            } catch (const char* e) { Debug::log(ERR, "Proxy failed: {}", e); }

            response.send(Pistache::Http::Code::Bad_Gateway, "Bad Gateway");
        });
    Pistache::Async::Barrier<Pistache::Http::Response> b(resp);
    if (b.wait_for(std::chrono::seconds(g_pConfig->m_config.proxy_timeout_sec)) == std::cv_status::timeout && !answered->exchange(true)) {
        Debug::log(WARN, "Upstream {} did not answer within {}s", FORWARD_ADDRESS, g_pConfig->m_config.proxy_timeout_sec);
        response.send(Pistache::Http::Code::Gateway_Timeout, "Gateway Timeout");
    }

    client.shutdown();
}

void CServerHandler::copyUpstreamResponse(const Pistache::Http::Response& upstream, Pistache::Http::ResponseWriter& response) {
    for (const auto& h : upstream.headers().list()) {
        std::stringstream ss;
        h->write(ss);

        // pistache frames the body itself
        const bool DROP = NHttpUtils::isHopByHopHeader(h->name());

        Debug::log(TRACE, "Header out: {}: {}{}", h->name(), ss.str(), DROP ? " (DROPPED)" : "");

        if (!DROP)
            response.headers().add(h);
    }

    for (const auto& c : upstream.cookies()) {
        response.cookies().add(c);
    }
}
