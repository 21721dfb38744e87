#include "common/models.hpp"

#include <utility>

namespace sysmend {

Fact Fact::resolved(std::string key, FactValue value,
                    std::chrono::system_clock::time_point fetchedAt)
{
    Fact fact;
    fact.m_key = std::move(key);
    fact.m_value = std::move(value);
    fact.m_fetchedAt = fetchedAt;
    return fact;
}

Fact Fact::failed(std::string key, std::string error,
                  std::chrono::system_clock::time_point fetchedAt)
{
    Fact fact;
    fact.m_key = std::move(key);
    fact.m_fetchedAt = fetchedAt;
    fact.m_error = std::move(error);
    return fact;
}

bool Fact::hasValue() const
{
    return !std::holds_alternative<std::monostate>(m_value);
}

const std::string *Fact::asString() const
{
    return std::get_if<std::string>(&m_value);
}

std::optional<bool> Fact::asBool() const
{
    if (const auto *flag = std::get_if<bool>(&m_value)) {
        return *flag;
    }
    if (const auto *maybe = std::get_if<std::optional<bool>>(&m_value)) {
        return *maybe;
    }
    return std::nullopt;
}

const std::vector<std::string> *Fact::asList() const
{
    return std::get_if<std::vector<std::string>>(&m_value);
}

Snapshot::Snapshot(std::string id, std::chrono::system_clock::time_point capturedAt,
                   FactMap facts)
    : m_id(std::move(id))
    , m_capturedAt(capturedAt)
    , m_facts(std::move(facts))
{
}

const Fact *Snapshot::find(const std::string &key) const
{
    const auto it = m_facts.find(key);
    if (it == m_facts.end()) {
        return nullptr;
    }
    return &it->second;
}

bool Snapshot::contains(const std::string &key) const
{
    return m_facts.find(key) != m_facts.end();
}

std::vector<std::string> Snapshot::keys() const
{
    std::vector<std::string> out;
    out.reserve(m_facts.size());
    for (const auto &item : m_facts) {
        out.push_back(item.first);
    }
    return out;
}

} // namespace sysmend
