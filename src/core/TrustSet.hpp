#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <expected>

#include "../config/IPRange.hpp"
#include "../config/ConfigTypes.hpp"

// Sorted, merged set of trusted ranges. Immutable once built.
// A default constructed set trusts nothing.
class CTrustSet {
  public:
    CTrustSet() = default;

    static std::expected<CTrustSet, std::string> fromSources(const std::vector<std::string>& sources);

    eTrustResult                                 contains(const std::string_view& address) const;
    bool                                         contains(const CIP& ip) const;

    bool                                         empty() const;
    const std::vector<CIPRange>&                 ranges() const;

  private:
    std::vector<CIPRange> m_ranges;
};
