#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sysmend {

// In-memory record of the value each mutated target held before this
// process first changed it. Targets are identified by operation plus args
// without their "value" member.
class SessionJournal
{
public:
    static std::string targetKey(const std::string &operation, const nlohmann::json &args);

    // Keeps the first value recorded for a target.
    void recordOriginal(const std::string &operation, const nlohmann::json &args,
                        const nlohmann::json &value);
    std::optional<nlohmann::json> original(const std::string &operation,
                                           const nlohmann::json &args) const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::map<std::string, nlohmann::json> m_originals;
};

} // namespace sysmend
