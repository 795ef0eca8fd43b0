#include <iostream>
#include <optional>
#include <pistache/common.h>
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/net.h>

#include "debug/log.hpp"

#include "core/Handler.hpp"

#include "config/Config.hpp"

#include "logging/TrafficLogger.hpp"

#include <signal.h>

struct SArgs {
    std::string configPath;
    bool        help = false;
};

static std::optional<SArgs> parseArgs(int argc, char** argv) {
    SArgs                          args;
    const std::vector<std::string> ARGS{argv + 1, argv + argc};

    for (size_t i = 0; i < ARGS.size(); ++i) {
        if (ARGS[i] == "--help" || ARGS[i] == "-h")
            args.help = true;
        else if (ARGS[i] == "--config" || ARGS[i] == "-c") {
            if (i + 1 >= ARGS.size()) {
                std::cerr << ARGS[i] << " needs a path\n";
                return std::nullopt;
            }

            args.configPath = ARGS[++i];
        } else
            std::cerr << "Unrecognized / invalid use of option " << ARGS[i] << "\nContinuing...\n";
    }

    return args;
}

// blocks until a terminating signal arrives
static void waitForShutdown(const sigset_t& signals) {
    while (true) {
        int       sig    = 0;
        const int STATUS = sigwait(&signals, &sig);

        if (STATUS != 0) {
            Debug::log(CRIT, "sigwait failed with {}", STATUS);
            return;
        }

        if (sig == SIGPIPE || sig == SIGALRM)
            continue;

        Debug::log(LOG, "Caught signal {}", sig);
        return;
    }
}

int main(int argc, char** argv, char** envp) {
    const auto ARGS = parseArgs(argc, argv);

    if (!ARGS)
        return 1;

    if (ARGS->help) {
        std::cout << "trustgate " << TRUSTGATE_VERSION << "\n"
                  << "usage: trustgate [-c|--config <path>]\n"
                  << "  -c, --config  jsonc config file, defaults are used without one\n"
                  << "  -h, --help    show this and exit\n";
        return 0;
    }

    g_pConfig = std::make_unique<CConfig>(ARGS->configPath);

    if (!g_pConfig->m_config.trusted_proxy.enabled)
        Debug::log(WARN, "Automatic resolution is disabled, requests will keep their transport address");

    // handled by waitForShutdown, not by the default handlers
    sigset_t signals;
    if (sigemptyset(&signals) != 0 || sigaddset(&signals, SIGTERM) != 0 || sigaddset(&signals, SIGINT) != 0 || sigaddset(&signals, SIGQUIT) != 0 ||
        sigaddset(&signals, SIGPIPE) != 0 || sigaddset(&signals, SIGALRM) != 0 || sigprocmask(SIG_BLOCK, &signals, nullptr) != 0) {
        Debug::log(CRIT, "Failed to set up the signal mask");
        return 1;
    }

    g_pTrafficLogger = std::make_unique<CTrafficLogger>();

    const Pistache::Address ADDRESS = {Pistache::Ipv4::any(), (uint16_t)g_pConfig->m_config.port};
    Debug::log(LOG, "Starting trustgate {} on {}:{}, forwarding to {}", TRUSTGATE_VERSION, ADDRESS.host(), ADDRESS.port().toString(), g_pConfig->m_config.forward_address);

    auto endpoint = std::make_unique<Pistache::Http::Endpoint>(ADDRESS);
    endpoint->init(Pistache::Http::Endpoint::options()
                       .threads(1)
                       .flags(Pistache::Tcp::Options::ReuseAddr | Pistache::Tcp::Options::ReusePort)
                       .maxRequestSize(g_pConfig->m_config.max_request_size));
    endpoint->setHandler(Pistache::Http::make_handler<CServerHandler>(g_pConfig->m_parsedConfigDatas.resolver));
    endpoint->serveThreaded();

    waitForShutdown(signals);

    sigprocmask(SIG_UNBLOCK, &signals, nullptr);

    Debug::log(LOG, "Shutting down, bye!");

    endpoint->shutdown();
    endpoint.reset();
    g_pTrafficLogger.reset();

    return 0;
}
