#include "core/precondition.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <regex>

#include "common/json_utils.hpp"

namespace sysmend {

namespace {

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool containsCaseInsensitive(const std::string &value, const std::string &needle)
{
    if (needle.empty()) {
        return true;
    }
    return toLower(value).find(toLower(needle)) != std::string::npos;
}

bool factContains(const Fact &fact, const std::string &needle)
{
    if (const auto *text = fact.asString()) {
        return containsCaseInsensitive(*text, needle);
    }
    if (const auto *list = fact.asList()) {
        return std::any_of(list->begin(), list->end(), [&](const std::string &item) {
            return containsCaseInsensitive(item, needle);
        });
    }
    return false;
}

bool factMatches(const Fact &fact, const std::string &pattern)
{
    const std::regex re(pattern, std::regex::ECMAScript);
    if (const auto *text = fact.asString()) {
        return std::regex_search(*text, re);
    }
    if (const auto *list = fact.asList()) {
        return std::any_of(list->begin(), list->end(), [&](const std::string &item) {
            return std::regex_search(item, re);
        });
    }
    return false;
}

bool isPresent(const Fact &fact)
{
    if (!fact.hasValue()) {
        return false;
    }
    if (const auto *maybe = std::get_if<std::optional<bool>>(&fact.value())) {
        return maybe->has_value();
    }
    return true;
}

} // namespace

std::string describePrecondition(const Precondition &precondition)
{
    if (!precondition.description.empty()) {
        return precondition.description;
    }
    std::string text = precondition.factKey + " " + toPredicateString(precondition.kind);
    if (!precondition.expected.is_null()) {
        text += " " + precondition.expected.dump();
    }
    return text;
}

bool evaluatePrecondition(const Precondition &precondition, const Snapshot &snapshot,
                          std::string *reason)
{
    auto fail = [&](const std::string &why) {
        if (reason) {
            *reason = describePrecondition(precondition) + ": " + why;
        }
        return false;
    };

    const Fact *fact = snapshot.find(precondition.factKey);
    if (!fact) {
        return fail("fact not in snapshot");
    }
    if (!fact->ok()) {
        return fail("fact unavailable (" + *fact->error() + ")");
    }

    try {
        switch (precondition.kind) {
        case PredicateKind::Present:
            return isPresent(*fact) ? true : fail("fact has no value");
        case PredicateKind::Equals:
            if (factValueToJson(fact->value()) == precondition.expected) {
                return true;
            }
            return fail("actual " + factValueToJson(fact->value()).dump());
        case PredicateKind::NotEquals:
            if (factValueToJson(fact->value()) != precondition.expected) {
                return true;
            }
            return fail("actual " + factValueToJson(fact->value()).dump());
        case PredicateKind::Contains:
            if (!precondition.expected.is_string()) {
                return fail("expected value is not a string");
            }
            return factContains(*fact, precondition.expected.get<std::string>())
                ? true
                : fail("actual " + factValueToJson(fact->value()).dump());
        case PredicateKind::Matches:
            if (!precondition.expected.is_string()) {
                return fail("expected value is not a pattern");
            }
            return factMatches(*fact, precondition.expected.get<std::string>())
                ? true
                : fail("actual " + factValueToJson(fact->value()).dump());
        case PredicateKind::Custom:
            if (!precondition.custom) {
                return fail("no predicate");
            }
            return precondition.custom(*fact) ? true : fail("predicate returned false");
        }
    } catch (const std::exception &ex) {
        return fail(std::string("predicate error: ") + ex.what());
    } catch (...) {
        return fail("predicate error: unknown exception");
    }
    return fail("unsupported predicate");
}

std::vector<std::string> unmetPreconditions(const std::vector<Precondition> &preconditions,
                                            const Snapshot &snapshot)
{
    std::vector<std::string> unmet;
    for (const auto &precondition : preconditions) {
        std::string reason;
        if (!evaluatePrecondition(precondition, snapshot, &reason)) {
            unmet.push_back(reason);
        }
    }
    return unmet;
}

Precondition makePrecondition(std::string factKey, PredicateKind kind,
                              nlohmann::json expected)
{
    Precondition precondition;
    precondition.factKey = std::move(factKey);
    precondition.kind = kind;
    precondition.expected = std::move(expected);
    return precondition;
}

} // namespace sysmend
