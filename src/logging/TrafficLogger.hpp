#pragma once

#include <string>
#include <cstdint>
#include <memory>
#include <fstream>
#include <vector>
#include <mutex>

#include "../config/ConfigTypes.hpp"
#include "../core/Resolver.hpp"

#include <pistache/http.h>

class CTrafficLogger {
  public:
    CTrafficLogger();
    ~CTrafficLogger();

    void logTraffic(const Pistache::Http::Request& req, const SRequestAddressState& state, eResolutionOutcome outcome);

  private:
    enum eTrafficLoggerProps : uint8_t {
        TRAFFIC_EPOCH = 0,
        TRAFFIC_IP,
        TRAFFIC_PEER,
        TRAFFIC_PROXY,
        TRAFFIC_SCHEME,
        TRAFFIC_HOST,
        TRAFFIC_RESOURCE,
        TRAFFIC_USERAGENT,
        TRAFFIC_OUTCOME,
    };

    std::vector<eTrafficLoggerProps> m_logSchema;
    std::ofstream                    m_file;
    std::mutex                       m_fileMutex;
};

inline std::unique_ptr<CTrafficLogger> g_pTrafficLogger;
