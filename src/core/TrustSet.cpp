#include "TrustSet.hpp"

#include <algorithm>
#include <iterator>

#include "../helpers/StringUtils.hpp"

std::expected<CTrustSet, std::string> CTrustSet::fromSources(const std::vector<std::string>& sources) {
    CTrustSet set;

    for (const auto& s : sources) {
        auto range = CIPRange::fromString(s);
        if (!range)
            return std::unexpected(range.error());

        set.m_ranges.emplace_back(std::move(*range));
    }

    std::sort(set.m_ranges.begin(), set.m_ranges.end(), [](const CIPRange& a, const CIPRange& b) { return a.start() < b.start(); });

    // collapse overlaps
    std::vector<CIPRange> merged;
    for (const auto& r : set.m_ranges) {
        if (!merged.empty() && merged.back().overlaps(r))
            merged.back().merge(r);
        else
            merged.emplace_back(r);
    }

    set.m_ranges = std::move(merged);

    return set;
}

eTrustResult CTrustSet::contains(const std::string_view& address) const {
    const auto IP = CIP::fromString(NStringUtils::trim(address));

    if (!IP)
        return TRUST_INVALID;

    return contains(*IP) ? TRUST_TRUSTED : TRUST_UNTRUSTED;
}

bool CTrustSet::contains(const CIP& ipRaw) const {
    const auto IP = ipRaw.toV4();

    // first range starting after IP, the candidate is the one before it
    auto it = std::upper_bound(m_ranges.begin(), m_ranges.end(), IP, [](const CIP& ip, const CIPRange& r) { return ip < r.start(); });

    if (it == m_ranges.begin())
        return false;

    return std::prev(it)->ipMatches(IP);
}

bool CTrustSet::empty() const {
    return m_ranges.empty();
}

const std::vector<CIPRange>& CTrustSet::ranges() const {
    return m_ranges;
}
