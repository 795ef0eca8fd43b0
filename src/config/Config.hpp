#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <expected>

#include "../core/Resolver.hpp"

class CConfig {
  public:
    // empty path runs with the defaults
    CConfig(const std::string& path);

    struct STrustedProxyConfig {
        bool                     enabled         = true;
        std::vector<std::string> ip_headers      = {"x-real-ip", "x-forwarded-for"};
        std::vector<std::string> scheme_headers  = {"x-ssl", "x-forwarded-proto"};
        std::vector<std::string> https_values    = {"1", "true", "https", "on", "enable", "enabled"};
        std::optional<bool>      parse_rfc7239   = std::nullopt;
        std::optional<bool>      parse_forwarded = std::nullopt;
        std::vector<std::string> trusted_sources = {"127.0.0.0/8", "10.0.0.0/8"};
        bool                     hide_headers    = false;
    };

    // headers carrying the resolved values to the upstream, empty to skip
    struct SUpstreamConfig {
        std::string client_address_header = "X-Real-IP";
        std::string scheme_header         = "X-Forwarded-Proto";
    };

    struct SLoggingConfig {
        bool        log_traffic        = false;
        std::string traffic_log_schema = "epoch,ip,peer,scheme,host,resource,outcome";
        std::string traffic_log_file   = "";
    };

    struct SConfig {
        int                 port              = 3001;
        std::string         forward_address   = "127.0.0.1:3000";
        unsigned long int   max_request_size  = 10000000; // 10MB
        unsigned long int   proxy_timeout_sec = 120;      // 2 minutes
        bool                trace_logging     = false;
        STrustedProxyConfig trusted_proxy;
        SUpstreamConfig     upstream;
        SLoggingConfig      logging;
    } m_config;

    struct SParsedTrustedProxy {
        SResolutionConfig resolution;
        CTrustSet         trust;
    };

    struct {
        std::shared_ptr<const CForwardingResolver> resolver;
    } m_parsedConfigDatas;

    static std::expected<SConfig, std::string>             parseJson(const std::string& json);
    static std::expected<SParsedTrustedProxy, std::string> parseTrustedProxy(const STrustedProxyConfig& conf);
};

inline std::unique_ptr<CConfig> g_pConfig;
