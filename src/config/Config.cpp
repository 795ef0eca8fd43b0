#include "Config.hpp"

#include <filesystem>

#include <glaze/glaze.hpp>

#include "../helpers/FsUtils.hpp"
#include "../helpers/StringUtils.hpp"

#include "../debug/log.hpp"

// header names and https values are matched case-insensitively, store them lowercase
static std::expected<std::vector<std::string>, std::string> normalizeList(const std::vector<std::string>& list, const char* name) {
    std::vector<std::string> result;

    for (const auto& e : list) {
        const auto TRIMMED = NStringUtils::trim(e);

        if (TRIMMED.empty())
            return std::unexpected(fmt::format("{} contains an empty entry", name));

        result.emplace_back(NStringUtils::toLower(TRIMMED));
    }

    return result;
}

CConfig::CConfig(const std::string& path) {
    if (path.empty())
        Debug::log(WARN, "No config passed, running with defaults");
    else {
        const auto PATH = NFsUtils::isAbsolute(path) ? path : std::filesystem::current_path().string() + "/" + path;
        const auto FILE = NFsUtils::readFileAsString(PATH);

        if (!FILE)
            Debug::die("Couldn't read config at {}: {}", PATH, FILE.error());

        auto json = parseJson(FILE.value());

        if (!json.has_value())
            Debug::die("Config has bad format: {}", json.error());

        m_config = json.value();
    }

    auto trustedProxy = parseTrustedProxy(m_config.trusted_proxy);

    if (!trustedProxy.has_value())
        Debug::die("Invalid trusted_proxy config: {}", trustedProxy.error());

    if (trustedProxy->trust.empty())
        Debug::log(WARN, "trusted_sources is empty, no peer will be trusted");

    for (const auto& r : trustedProxy->trust.ranges()) {
        Debug::log(LOG, "Trusting {}", r.toString());
    }

    m_parsedConfigDatas.resolver = std::make_shared<const CForwardingResolver>(std::move(trustedProxy->resolution), std::move(trustedProxy->trust));
}

std::expected<CConfig::SConfig, std::string> CConfig::parseJson(const std::string& json) {
    auto parsed = glz::read_jsonc<SConfig>(json);

    if (!parsed.has_value())
        return std::unexpected(glz::format_error(parsed.error(), json));

    return parsed.value();
}

std::expected<CConfig::SParsedTrustedProxy, std::string> CConfig::parseTrustedProxy(const STrustedProxyConfig& conf) {
    SParsedTrustedProxy result;

    auto                ipHeaders = normalizeList(conf.ip_headers, "ip_headers");
    if (!ipHeaders)
        return std::unexpected(ipHeaders.error());

    auto schemeHeaders = normalizeList(conf.scheme_headers, "scheme_headers");
    if (!schemeHeaders)
        return std::unexpected(schemeHeaders.error());

    auto httpsValues = normalizeList(conf.https_values, "https_values");
    if (!httpsValues)
        return std::unexpected(httpsValues.error());

    auto trust = CTrustSet::fromSources(conf.trusted_sources);
    if (!trust)
        return std::unexpected(fmt::format("trusted_sources: {}", trust.error()));

    result.resolution.ipHeaders     = std::move(*ipHeaders);
    result.resolution.schemeHeaders = std::move(*schemeHeaders);
    result.resolution.httpsValues   = std::move(*httpsValues);
    result.resolution.parseRFC7239  = conf.parse_rfc7239.value_or(conf.parse_forwarded.value_or(true));
    result.resolution.hideHeaders   = conf.hide_headers;
    result.resolution.enabled       = conf.enabled;
    result.trust                    = std::move(*trust);

    return result;
}
