#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace sysmend {

// std::monostate is the "absent" value.
using FactValue = std::variant<std::monostate,
                               std::string,
                               bool,
                               std::optional<bool>,
                               std::vector<std::string>>;

// A named unit of system information. value and error are never both set.
class Fact
{
public:
    Fact() = default;

    static Fact resolved(std::string key, FactValue value,
                         std::chrono::system_clock::time_point fetchedAt);
    static Fact failed(std::string key, std::string error,
                       std::chrono::system_clock::time_point fetchedAt);

    const std::string &key() const { return m_key; }
    const FactValue &value() const { return m_value; }
    std::chrono::system_clock::time_point fetchedAt() const { return m_fetchedAt; }
    const std::optional<std::string> &error() const { return m_error; }

    bool ok() const { return !m_error.has_value(); }
    bool hasValue() const;

    const std::string *asString() const;
    std::optional<bool> asBool() const;
    const std::vector<std::string> *asList() const;

private:
    std::string m_key;
    FactValue m_value;
    std::chrono::system_clock::time_point m_fetchedAt;
    std::optional<std::string> m_error;
};

using FactMap = std::map<std::string, Fact>;

// Immutable result of one probe cycle.
class Snapshot
{
public:
    Snapshot(std::string id, std::chrono::system_clock::time_point capturedAt,
             FactMap facts);

    const std::string &id() const { return m_id; }
    std::chrono::system_clock::time_point capturedAt() const { return m_capturedAt; }
    const FactMap &facts() const { return m_facts; }

    const Fact *find(const std::string &key) const;
    bool contains(const std::string &key) const;
    std::vector<std::string> keys() const;

private:
    std::string m_id;
    std::chrono::system_clock::time_point m_capturedAt;
    FactMap m_facts;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

struct CacheEntry {
    SnapshotPtr snapshot;
    std::chrono::steady_clock::time_point capturedAt;
    std::chrono::milliseconds ttl;
};

struct Precondition {
    std::string factKey;
    PredicateKind kind = PredicateKind::Present;
    nlohmann::json expected;
    // Only used for PredicateKind::Custom.
    std::function<bool(const Fact &)> custom;
    std::string description;
};

struct SubStepSpec {
    std::string name;
    std::string operation;
    nlohmann::json args = nlohmann::json::object();
    // Set on steps that undo a change; pre-session restore rewrites their value.
    bool restoring = false;
};

struct ActionSpec {
    std::string id;
    std::string description;
    std::vector<Precondition> preconditions;
    std::vector<SubStepSpec> apply;
    std::vector<SubStepSpec> revert;
};

struct ActionSummary {
    std::string id;
    std::string description;
};

struct SubStepResult {
    std::string name;
    std::string operation;
    SubStepStatus status = SubStepStatus::Failed;
    std::string detail;
};

struct ActionResult {
    std::string actionId;
    ActionStatus status = ActionStatus::Failure;
    std::string detail;
    std::vector<SubStepResult> subStepResults;
};

struct BatchResult {
    std::vector<ActionResult> results;
    bool cancelled = false;
};

} // namespace sysmend
