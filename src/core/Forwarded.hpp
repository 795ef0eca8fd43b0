#pragma once

#include <string>
#include <string_view>
#include <optional>

// RFC 7239 Forwarded header. Only the first element (nearest hop as written by
// the immediate peer) is parsed, and only the for, by, proto and host parameters.
namespace NForwarded {
    struct SForwardedElement {
        std::optional<std::string> forNode;
        std::optional<std::string> byNode;
        std::optional<std::string> proto;
        std::optional<std::string> host;
    };

    // nullopt if the first element is malformed
    std::optional<SForwardedElement> parseFirstElement(const std::string_view& value);

    // strips quotes, [] around v6 and a trailing :port
    std::string                      nodeAddress(const std::string_view& node);
};
