#pragma once

#include <cstdint>

enum eTrustResult : uint8_t {
    TRUST_INVALID = 0,
    TRUST_UNTRUSTED,
    TRUST_TRUSTED
};

enum eResolutionOutcome : uint8_t {
    RESOLUTION_DISABLED = 0,
    RESOLUTION_PASSTHROUGH,
    RESOLUTION_REWRITTEN
};

inline const char* outcomeToString(eResolutionOutcome o) {
    switch (o) {
        case RESOLUTION_DISABLED: return "DISABLED";
        case RESOLUTION_PASSTHROUGH: return "PASSTHROUGH";
        case RESOLUTION_REWRITTEN: return "REWRITTEN";
    }

    return "ERROR";
}
