#pragma once

#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace sysmend {

// Ordered, case-insensitive pattern -> label table. The first matching
// pattern wins; text matching nothing maps to the default label.
class PatternTable
{
public:
    PatternTable(std::vector<std::pair<std::string, std::string>> entries,
                 std::string defaultLabel);

    std::string classify(const std::string &text) const;
    // Classifies each element and returns the first non-default label.
    std::string classifyAny(const std::vector<std::string> &texts) const;
    bool matchesAny(const std::string &text) const;

    const std::string &defaultLabel() const { return m_defaultLabel; }

private:
    struct Entry {
        std::regex pattern;
        std::string label;
    };

    std::vector<Entry> m_entries;
    std::string m_defaultLabel;
};

} // namespace sysmend
