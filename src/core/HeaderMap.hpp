#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>

// Ordered request header view with case-insensitive names. Duplicate names are kept.
class CHeaderMap {
  public:
    struct SHeader {
        std::string name;
        std::string value;
    };

    void                       add(const std::string& name, const std::string& value);
    // replaces every header called name
    void                       set(const std::string& name, const std::string& value);
    bool                       has(const std::string_view& name) const;
    std::optional<std::string> get(const std::string_view& name) const;
    size_t                     remove(const std::string_view& name);

    // first header of names that is present with a non-empty value
    std::optional<SHeader>     firstOf(const std::vector<std::string>& names) const;

    const std::vector<SHeader>& list() const;
    size_t                      size() const;

  private:
    std::vector<SHeader> m_headers;
};
