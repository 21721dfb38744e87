#include "core/pattern_table.hpp"

#include "common/errors.hpp"

namespace sysmend {

PatternTable::PatternTable(std::vector<std::pair<std::string, std::string>> entries,
                           std::string defaultLabel)
    : m_defaultLabel(std::move(defaultLabel))
{
    m_entries.reserve(entries.size());
    for (auto &entry : entries) {
        try {
            m_entries.push_back(Entry{
                std::regex(entry.first, std::regex::ECMAScript | std::regex::icase),
                std::move(entry.second)});
        } catch (const std::regex_error &ex) {
            throw ConfigError("invalid pattern '" + entry.first + "': " + ex.what());
        }
    }
}

std::string PatternTable::classify(const std::string &text) const
{
    for (const auto &entry : m_entries) {
        if (std::regex_search(text, entry.pattern)) {
            return entry.label;
        }
    }
    return m_defaultLabel;
}

std::string PatternTable::classifyAny(const std::vector<std::string> &texts) const
{
    for (const auto &text : texts) {
        std::string label = classify(text);
        if (label != m_defaultLabel) {
            return label;
        }
    }
    return m_defaultLabel;
}

bool PatternTable::matchesAny(const std::string &text) const
{
    for (const auto &entry : m_entries) {
        if (std::regex_search(text, entry.pattern)) {
            return true;
        }
    }
    return false;
}

} // namespace sysmend
