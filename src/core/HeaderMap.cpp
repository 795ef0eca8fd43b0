#include "HeaderMap.hpp"

#include <algorithm>

#include "../helpers/StringUtils.hpp"

void CHeaderMap::add(const std::string& name, const std::string& value) {
    m_headers.emplace_back(SHeader{name, value});
}

void CHeaderMap::set(const std::string& name, const std::string& value) {
    remove(name);
    add(name, value);
}

bool CHeaderMap::has(const std::string_view& name) const {
    return std::any_of(m_headers.begin(), m_headers.end(), [&name](const SHeader& h) { return NStringUtils::equalsIgnoreCase(h.name, name); });
}

std::optional<std::string> CHeaderMap::get(const std::string_view& name) const {
    for (const auto& h : m_headers) {
        if (NStringUtils::equalsIgnoreCase(h.name, name))
            return h.value;
    }

    return std::nullopt;
}

size_t CHeaderMap::remove(const std::string_view& name) {
    return std::erase_if(m_headers, [&name](const SHeader& h) { return NStringUtils::equalsIgnoreCase(h.name, name); });
}

std::optional<CHeaderMap::SHeader> CHeaderMap::firstOf(const std::vector<std::string>& names) const {
    for (const auto& n : names) {
        const auto VALUE = get(n);

        if (!VALUE || NStringUtils::trim(*VALUE).empty())
            continue;

        return SHeader{n, *VALUE};
    }

    return std::nullopt;
}

const std::vector<CHeaderMap::SHeader>& CHeaderMap::list() const {
    return m_headers;
}

size_t CHeaderMap::size() const {
    return m_headers.size();
}
