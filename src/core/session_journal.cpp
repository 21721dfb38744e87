#include "core/session_journal.hpp"

namespace sysmend {

std::string SessionJournal::targetKey(const std::string &operation, const nlohmann::json &args)
{
    nlohmann::json target = args.is_object() ? args : nlohmann::json::object();
    target.erase("value");
    return operation + "|" + target.dump();
}

void SessionJournal::recordOriginal(const std::string &operation, const nlohmann::json &args,
                                    const nlohmann::json &value)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_originals.emplace(targetKey(operation, args), value);
}

std::optional<nlohmann::json> SessionJournal::original(const std::string &operation,
                                                       const nlohmann::json &args) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_originals.find(targetKey(operation, args));
    if (it == m_originals.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t SessionJournal::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_originals.size();
}

void SessionJournal::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_originals.clear();
}

} // namespace sysmend
