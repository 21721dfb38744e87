#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sysmend {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toActionStatusString(ActionStatus status)
{
    switch (status) {
    case ActionStatus::Success:
        return "success";
    case ActionStatus::SkippedPrecondition:
        return "skipped_precondition";
    case ActionStatus::PartialFailure:
        return "partial_failure";
    case ActionStatus::Failure:
        return "failure";
    case ActionStatus::Cancelled:
        return "cancelled";
    }
    return "failure";
}

inline std::string toSubStepStatusString(SubStepStatus status)
{
    switch (status) {
    case SubStepStatus::Applied:
        return "applied";
    case SubStepStatus::AlreadyApplied:
        return "already_applied";
    case SubStepStatus::Failed:
        return "failed";
    }
    return "failed";
}

inline std::string toPredicateString(PredicateKind kind)
{
    switch (kind) {
    case PredicateKind::Equals:
        return "equals";
    case PredicateKind::NotEquals:
        return "not_equals";
    case PredicateKind::Present:
        return "present";
    case PredicateKind::Contains:
        return "contains";
    case PredicateKind::Matches:
        return "matches";
    case PredicateKind::Custom:
        return "custom";
    }
    return "custom";
}

// Returns false for names outside the declarative set.
inline bool parsePredicateString(const std::string &value, PredicateKind *kind)
{
    if (value == "equals") {
        *kind = PredicateKind::Equals;
    } else if (value == "not_equals") {
        *kind = PredicateKind::NotEquals;
    } else if (value == "present") {
        *kind = PredicateKind::Present;
    } else if (value == "contains") {
        *kind = PredicateKind::Contains;
    } else if (value == "matches") {
        *kind = PredicateKind::Matches;
    } else {
        return false;
    }
    return true;
}

inline std::string toRestoreModeString(RestoreMode mode)
{
    switch (mode) {
    case RestoreMode::FactoryDefaults:
        return "factory";
    case RestoreMode::PreSession:
        return "pre_session";
    }
    return "pre_session";
}

inline bool parseRestoreModeString(const std::string &value, RestoreMode *mode)
{
    if (value == "factory") {
        *mode = RestoreMode::FactoryDefaults;
        return true;
    }
    if (value == "pre_session") {
        *mode = RestoreMode::PreSession;
        return true;
    }
    return false;
}

// Absent and unknown optional-booleans both map to null.
inline nlohmann::json factValueToJson(const FactValue &value)
{
    if (const auto *text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const auto *flag = std::get_if<bool>(&value)) {
        return *flag;
    }
    if (const auto *maybe = std::get_if<std::optional<bool>>(&value)) {
        if (maybe->has_value()) {
            return **maybe;
        }
        return nullptr;
    }
    if (const auto *list = std::get_if<std::vector<std::string>>(&value)) {
        return *list;
    }
    return nullptr;
}

inline std::string factValueTypeString(const FactValue &value)
{
    switch (value.index()) {
    case 1:
        return "string";
    case 2:
        return "bool";
    case 3:
        return "optional_bool";
    case 4:
        return "list";
    default:
        return "absent";
    }
}

inline void to_json(nlohmann::json &j, const Fact &fact)
{
    j = nlohmann::json{
        {"key", fact.key()},
        {"type", factValueTypeString(fact.value())},
        {"value", factValueToJson(fact.value())},
        {"fetchedAt", toIso8601Utc(fact.fetchedAt())}
    };
    if (fact.error().has_value()) {
        j["error"] = *fact.error();
    } else {
        j["error"] = nullptr;
    }
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    nlohmann::json facts = nlohmann::json::object();
    for (const auto &item : snapshot.facts()) {
        facts[item.first] = item.second;
    }
    j = nlohmann::json{
        {"id", snapshot.id()},
        {"capturedAt", toIso8601Utc(snapshot.capturedAt())},
        {"facts", facts}
    };
}

inline void to_json(nlohmann::json &j, const SubStepResult &result)
{
    j = nlohmann::json{
        {"name", result.name},
        {"operation", result.operation},
        {"status", toSubStepStatusString(result.status)},
        {"detail", result.detail}
    };
}

inline void to_json(nlohmann::json &j, const ActionResult &result)
{
    j = nlohmann::json{
        {"actionId", result.actionId},
        {"status", toActionStatusString(result.status)},
        {"detail", result.detail},
        {"subSteps", result.subStepResults}
    };
}

inline void to_json(nlohmann::json &j, const BatchResult &batch)
{
    j = nlohmann::json{
        {"cancelled", batch.cancelled},
        {"results", batch.results}
    };
}

inline void to_json(nlohmann::json &j, const ActionSummary &summary)
{
    j = nlohmann::json{{"id", summary.id}, {"description", summary.description}};
}

} // namespace sysmend
