#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <compare>
#include <cstdint>

// v4 addresses keep 4 byte blocks, v6 addresses keep 8 16-bit blocks
class CIP {
  public:
    CIP() = default;

    static std::optional<CIP> fromString(const std::string_view& ip);

    bool                      m_v6 = false;
    std::vector<uint16_t>     m_blocks;

    // ::ffff:a.b.c.d
    bool                      isV4Mapped() const;
    CIP                       toV4() const;
    std::string               toString() const;

    auto                      operator<=>(const CIP& other) const = default;
    bool                      operator==(const CIP& other) const = default;

  private:
    bool parseV4(const std::string_view& ip);
    bool parseV6(const std::string_view& ip);
};

// Accepts both ipv4 and ipv6, as a single address, a subnet (a/n) or an inclusive range (a-b)
class CIPRange {
  public:
    CIPRange(const CIP& start, const CIP& end);

    static std::expected<CIPRange, std::string> fromString(const std::string_view& range);

    bool                                        ipMatches(const CIP& ip) const;
    bool                                        overlaps(const CIPRange& other) const;
    void                                        merge(const CIPRange& other);

    const CIP&                                  start() const;
    const CIP&                                  end() const;
    std::string                                 toString() const;

  private:
    CIP m_start;
    CIP m_end;
};
