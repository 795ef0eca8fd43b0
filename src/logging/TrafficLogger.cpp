#include "TrafficLogger.hpp"

#include <chrono>
#include <array>
#include <algorithm>
#include <utility>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "../config/Config.hpp"
#include "../debug/log.hpp"
#include "../helpers/StringUtils.hpp"

constexpr std::array<std::pair<std::string_view, uint8_t>, 9> TRAFFIC_COLUMNS = {{
    {"epoch", 0},
    {"ip", 1},
    {"peer", 2},
    {"proxy", 3},
    {"scheme", 4},
    {"host", 5},
    {"resource", 6},
    {"useragent", 7},
    {"outcome", 8},
}};

CTrafficLogger::CTrafficLogger() {
    const auto& LOGGING = g_pConfig->m_config.logging;

    if (!LOGGING.log_traffic)
        return;

    for (const auto& c : NStringUtils::split(LOGGING.traffic_log_schema, ',')) {
        const auto COLUMN = NStringUtils::trim(c);
        if (COLUMN.empty())
            continue;

        const auto IT = std::find_if(TRAFFIC_COLUMNS.begin(), TRAFFIC_COLUMNS.end(), [&COLUMN](const auto& e) { return e.first == COLUMN; });

        if (IT == TRAFFIC_COLUMNS.end()) {
            Debug::log(WARN, "TrafficLogger: unknown column {}, skipping", COLUMN);
            continue;
        }

        m_logSchema.emplace_back((eTrafficLoggerProps)IT->second);
    }

    if (m_logSchema.empty())
        Debug::log(WARN, "TrafficLogger: traffic_log_schema has no usable columns, nothing will be written");

    m_file.open(LOGGING.traffic_log_file, std::ios::app);

    if (!m_file.good())
        Debug::die("TrafficLogger: can't open \"{}\" for writing", LOGGING.traffic_log_file);

    Debug::log(LOG, "TrafficLogger: writing {} columns to {}", m_logSchema.size(), LOGGING.traffic_log_file);
}

CTrafficLogger::~CTrafficLogger() {
    if (m_file.is_open())
        m_file.close();
}

// quoted columns may carry client-controlled text
static std::string quoted(const std::string_view& s) {
    std::string out = "\"";
    for (const char c : s) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

void CTrafficLogger::logTraffic(const Pistache::Http::Request& req, const SRequestAddressState& state, eResolutionOutcome outcome) {
    if (!m_file.is_open() || m_logSchema.empty())
        return;

    std::vector<std::string> fields;
    fields.reserve(m_logSchema.size());

    for (const auto& t : m_logSchema) {
        switch (t) {
            case TRAFFIC_EPOCH:
                fields.emplace_back(fmt::format("{}", std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count()));
                break;
            case TRAFFIC_IP: fields.emplace_back(state.remoteAddress); break;
            case TRAFFIC_PEER: fields.emplace_back(state.peerAddress); break;
            case TRAFFIC_PROXY: fields.emplace_back(state.remoteProxyAddress); break;
            case TRAFFIC_SCHEME: fields.emplace_back(quoted(state.scheme)); break;
            case TRAFFIC_HOST: fields.emplace_back(quoted(state.host)); break;
            case TRAFFIC_RESOURCE: fields.emplace_back(quoted(req.resource())); break;
            case TRAFFIC_USERAGENT: {
                const auto UA = req.headers().tryGet<Pistache::Http::Header::UserAgent>();
                fields.emplace_back(UA ? quoted(UA->agent()) : "\"<no data>\"");
                break;
            }
            case TRAFFIC_OUTCOME: fields.emplace_back(outcomeToString(outcome)); break;
        }
    }

    const auto                  LINE = fmt::format("{}\n", fmt::join(fields, ","));

    std::lock_guard<std::mutex> lg(m_fileMutex);
    m_file << LINE;
    m_file.flush();
}
