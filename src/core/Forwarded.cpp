#include "Forwarded.hpp"

#include <algorithm>
#include <vector>

#include "../helpers/StringUtils.hpp"

// split on delim, ignoring delims inside a quoted-string
static std::vector<std::string_view> splitOutsideQuotes(const std::string_view& sv, char delim) {
    std::vector<std::string_view> result;

    bool                          quoted = false;
    size_t                        begin  = 0;
    for (size_t i = 0; i < sv.size(); ++i) {
        if (sv[i] == '"')
            quoted = !quoted;
        else if (sv[i] == delim && !quoted) {
            result.emplace_back(sv.substr(begin, i - begin));
            begin = i + 1;
        }
    }

    result.emplace_back(sv.substr(begin));

    return result;
}

std::optional<NForwarded::SForwardedElement> NForwarded::parseFirstElement(const std::string_view& value) {
    const auto ELEMENT = NStringUtils::trim(splitOutsideQuotes(value, ',').front());

    if (ELEMENT.empty())
        return std::nullopt;

    SForwardedElement result;

    for (const auto& pair : splitOutsideQuotes(ELEMENT, ';')) {
        const auto PAIR = NStringUtils::trim(pair);

        // forwarded-element = [ forwarded-pair ] *( ";" [ forwarded-pair ] )
        if (PAIR.empty())
            continue;

        const auto EQ = PAIR.find('=');
        if (EQ == std::string_view::npos)
            return std::nullopt;

        const auto KEY = NStringUtils::trim(PAIR.substr(0, EQ));
        auto       val = NStringUtils::trim(PAIR.substr(EQ + 1));

        if (KEY.empty() || val.empty())
            return std::nullopt;

        if (val.front() == '"') {
            if (val.size() < 2 || val.back() != '"')
                return std::nullopt;

            val = val.substr(1, val.size() - 2);
        }

        // no quoted-pair escaping support
        if (val.empty() || val.contains('"'))
            return std::nullopt;

        std::optional<std::string>* target = nullptr;

        const auto                  LC = NStringUtils::toLower(KEY);
        if (LC == "for")
            target = &result.forNode;
        else if (LC == "by")
            target = &result.byNode;
        else if (LC == "proto")
            target = &result.proto;
        else if (LC == "host")
            target = &result.host;
        else
            continue;

        // each parameter may only occur once per element
        if (target->has_value())
            return std::nullopt;

        *target = std::string{val};
    }

    return result;
}

std::string NForwarded::nodeAddress(const std::string_view& nodeRaw) {
    auto node = NStringUtils::trim(nodeRaw);

    if (node.size() >= 2 && node.front() == '"' && node.back() == '"')
        node = node.substr(1, node.size() - 2);

    if (node.starts_with('[')) {
        const auto CLOSE = node.find(']');
        if (CLOSE == std::string_view::npos)
            return std::string{node};

        return std::string{node.substr(1, CLOSE - 1)};
    }

    // v4 with a port
    if (std::count(node.begin(), node.end(), ':') == 1)
        return std::string{node.substr(0, node.find(':'))};

    return std::string{node};
}
