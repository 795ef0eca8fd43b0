#include "IPRange.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "../helpers/StringUtils.hpp"

static bool allOf(const std::string_view& sv, int (*pred)(int)) {
    return std::all_of(sv.begin(), sv.end(), [pred](const char& c) { return pred((unsigned char)c); });
}

std::optional<CIP> CIP::fromString(const std::string_view& ip) {
    CIP result;

    if (ip.contains(':')) {
        if (!result.parseV6(ip))
            return std::nullopt;
    } else if (std::count(ip.begin(), ip.end(), '.') == 3) {
        if (!result.parseV4(ip))
            return std::nullopt;
    } else
        return std::nullopt;

    return result;
}

bool CIP::parseV4(const std::string_view& ip) {
    m_v6 = false;
    m_blocks.clear();

    const auto PARTS = NStringUtils::split(ip, '.');
    if (PARTS.size() != 4)
        return false;

    for (const auto& p : PARTS) {
        if (p.empty() || p.size() > 3 || !allOf(p, ::isdigit))
            return false;

        uint16_t byte = 0;
        std::from_chars(p.data(), p.data() + p.size(), byte);

        if (byte > 0xFF)
            return false;

        m_blocks.push_back(byte);
    }

    return true;
}

// parses colon separated hex groups, optionally ending in a dotted v4 tail
static bool parseV6Groups(const std::string_view& part, std::vector<uint16_t>& out, bool allowV4Tail) {
    if (part.empty())
        return true;

    const auto GROUPS = NStringUtils::split(part, ':');

    for (size_t i = 0; i < GROUPS.size(); ++i) {
        const auto& g = GROUPS[i];

        if (allowV4Tail && i == GROUPS.size() - 1 && g.contains('.')) {
            auto v4 = CIP::fromString(g);
            if (!v4 || v4->m_v6)
                return false;

            out.push_back((v4->m_blocks.at(0) << 8) | v4->m_blocks.at(1));
            out.push_back((v4->m_blocks.at(2) << 8) | v4->m_blocks.at(3));
            return true;
        }

        if (g.empty() || g.size() > 4 || !allOf(g, ::isxdigit))
            return false;

        uint16_t block = 0;
        std::from_chars(g.data(), g.data() + g.size(), block, 16);
        out.push_back(block);
    }

    return true;
}

bool CIP::parseV6(const std::string_view& ip) {
    m_v6 = true;
    m_blocks.clear();

    const auto COMPRESSED = ip.find("::");

    if (COMPRESSED == std::string_view::npos) {
        if (!parseV6Groups(ip, m_blocks, true))
            return false;

        return m_blocks.size() == 8;
    }

    // only one :: allowed
    if (ip.find("::", COMPRESSED + 1) != std::string_view::npos)
        return false;

    std::vector<uint16_t> head, tail;
    if (!parseV6Groups(ip.substr(0, COMPRESSED), head, false) || !parseV6Groups(ip.substr(COMPRESSED + 2), tail, true))
        return false;

    if (head.size() + tail.size() > 7)
        return false;

    m_blocks = head;
    m_blocks.resize(8 - tail.size(), 0);
    m_blocks.insert(m_blocks.end(), tail.begin(), tail.end());

    return true;
}

bool CIP::isV4Mapped() const {
    if (!m_v6 || m_blocks.size() != 8)
        return false;

    return std::all_of(m_blocks.begin(), m_blocks.begin() + 5, [](const uint16_t& b) { return b == 0; }) && m_blocks.at(5) == 0xFFFF;
}

CIP CIP::toV4() const {
    if (!isV4Mapped())
        return *this;

    CIP v4;
    v4.m_v6     = false;
    v4.m_blocks = {(uint16_t)(m_blocks.at(6) >> 8), (uint16_t)(m_blocks.at(6) & 0xFF), (uint16_t)(m_blocks.at(7) >> 8), (uint16_t)(m_blocks.at(7) & 0xFF)};
    return v4;
}

std::string CIP::toString() const {
    if (m_v6)
        return fmt::format("{:x}", fmt::join(m_blocks, ":"));

    return fmt::format("{}", fmt::join(m_blocks, "."));
}

//

static CIP applyPrefix(const CIP& ip, size_t prefix, bool fillHostBits) {
    CIP            result     = ip;
    const size_t   BLOCK_BITS = ip.m_v6 ? 16 : 8;
    const uint16_t FULL       = ip.m_v6 ? 0xFFFF : 0xFF;

    for (size_t i = 0; i < result.m_blocks.size(); ++i) {
        const size_t   START_BIT = i * BLOCK_BITS;
        const size_t   NET_BITS  = prefix <= START_BIT ? 0 : std::min(prefix - START_BIT, BLOCK_BITS);
        const uint16_t NET_MASK  = NET_BITS == 0 ? 0 : (uint16_t)((FULL << (BLOCK_BITS - NET_BITS)) & FULL);

        if (fillHostBits)
            result.m_blocks[i] = (result.m_blocks[i] & NET_MASK) | (~NET_MASK & FULL);
        else
            result.m_blocks[i] = result.m_blocks[i] & NET_MASK;
    }

    return result;
}

CIPRange::CIPRange(const CIP& start, const CIP& end) : m_start(start), m_end(end) {
    ;
}

std::expected<CIPRange, std::string> CIPRange::fromString(const std::string_view& rangeRaw) {
    const auto RANGE = NStringUtils::trim(rangeRaw);

    if (RANGE.empty())
        return std::unexpected("empty ip range");

    if (RANGE.contains('/')) {
        const auto SLASH  = RANGE.find('/');
        const auto IP     = CIP::fromString(RANGE.substr(0, SLASH));
        const auto SUBNET = RANGE.substr(SLASH + 1);

        if (!IP)
            return std::unexpected(fmt::format("invalid address in subnet {}", RANGE));

        if (SUBNET.empty() || SUBNET.size() > 3 || !allOf(SUBNET, ::isdigit))
            return std::unexpected(fmt::format("invalid prefix length in subnet {}", RANGE));

        size_t prefix = 0;
        std::from_chars(SUBNET.data(), SUBNET.data() + SUBNET.size(), prefix);

        if (prefix > (IP->m_v6 ? 128 : 32))
            return std::unexpected(fmt::format("prefix length out of bounds in subnet {}", RANGE));

        return CIPRange(applyPrefix(*IP, prefix, false), applyPrefix(*IP, prefix, true));
    }

    if (RANGE.contains('-')) {
        const auto DASH  = RANGE.find('-');
        const auto START = CIP::fromString(NStringUtils::trim(RANGE.substr(0, DASH)));
        const auto END   = CIP::fromString(NStringUtils::trim(RANGE.substr(DASH + 1)));

        if (!START || !END)
            return std::unexpected(fmt::format("invalid address in range {}", RANGE));

        if (START->m_v6 != END->m_v6)
            return std::unexpected(fmt::format("mixed address families in range {}", RANGE));

        if (*END < *START)
            return std::unexpected(fmt::format("range {} ends before it starts", RANGE));

        return CIPRange(*START, *END);
    }

    const auto IP = CIP::fromString(RANGE);
    if (!IP)
        return std::unexpected(fmt::format("invalid address {}", RANGE));

    return CIPRange(*IP, *IP);
}

bool CIPRange::ipMatches(const CIP& ip) const {
    if (m_start.m_v6 != ip.m_v6)
        return false;

    return m_start <= ip && ip <= m_end;
}

bool CIPRange::overlaps(const CIPRange& other) const {
    if (m_start.m_v6 != other.m_start.m_v6)
        return false;

    return m_start <= other.m_end && other.m_start <= m_end;
}

void CIPRange::merge(const CIPRange& other) {
    m_start = std::min(m_start, other.m_start);
    m_end   = std::max(m_end, other.m_end);
}

const CIP& CIPRange::start() const {
    return m_start;
}

const CIP& CIPRange::end() const {
    return m_end;
}

std::string CIPRange::toString() const {
    if (m_start == m_end)
        return m_start.toString();

    return fmt::format("{}-{}", m_start.toString(), m_end.toString());
}
