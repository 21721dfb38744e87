#include "core/action_catalog.hpp"

#include <regex>
#include <set>

#include <QFile>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/action_registry.hpp"

namespace sysmend {

namespace {

std::string requireString(const nlohmann::json &obj, const char *key, const std::string &path)
{
    if (!obj.contains(key) || !obj.at(key).is_string() || obj.at(key).get<std::string>().empty()) {
        throw ConfigError(path + "." + key + ": expected non-empty string");
    }
    return obj.at(key).get<std::string>();
}

const nlohmann::json &optionalArray(const nlohmann::json &obj, const char *key,
                                    const std::string &path)
{
    static const nlohmann::json kEmpty = nlohmann::json::array();
    if (!obj.contains(key)) {
        return kEmpty;
    }
    if (!obj.at(key).is_array()) {
        throw ConfigError(path + "." + key + ": expected array");
    }
    return obj.at(key);
}

Precondition parsePrecondition(const nlohmann::json &obj, const std::string &path)
{
    if (!obj.is_object()) {
        throw ConfigError(path + ": expected object");
    }

    Precondition precondition;
    precondition.factKey = requireString(obj, "fact", path);
    const std::string predicate = requireString(obj, "predicate", path);
    if (!parsePredicateString(predicate, &precondition.kind)) {
        throw ConfigError(path + ".predicate: unknown predicate '" + predicate + "'");
    }
    precondition.expected = obj.value("value", nlohmann::json());
    precondition.description = obj.value("description", "");

    switch (precondition.kind) {
    case PredicateKind::Equals:
    case PredicateKind::NotEquals:
        if (!obj.contains("value")) {
            throw ConfigError(path + ".value: required for '" + predicate + "'");
        }
        break;
    case PredicateKind::Contains:
        if (!precondition.expected.is_string()) {
            throw ConfigError(path + ".value: expected string");
        }
        break;
    case PredicateKind::Matches:
        if (!precondition.expected.is_string()) {
            throw ConfigError(path + ".value: expected pattern string");
        }
        try {
            const std::regex compiled(precondition.expected.get<std::string>(),
                                      std::regex::ECMAScript);
            (void)compiled;
        } catch (const std::regex_error &ex) {
            throw ConfigError(path + ".value: invalid pattern: " + ex.what());
        }
        break;
    default:
        break;
    }
    return precondition;
}

SubStepSpec parseSubStep(const nlohmann::json &obj, const std::string &path)
{
    if (!obj.is_object()) {
        throw ConfigError(path + ": expected object");
    }
    SubStepSpec step;
    step.name = requireString(obj, "name", path);
    step.operation = requireString(obj, "operation", path);
    if (obj.contains("args")) {
        if (!obj.at("args").is_object()) {
            throw ConfigError(path + ".args: expected object");
        }
        step.args = obj.at("args");
    }
    return step;
}

std::vector<SubStepSpec> parseSteps(const nlohmann::json &obj, const char *key,
                                    const std::string &path)
{
    std::vector<SubStepSpec> steps;
    const auto &array = optionalArray(obj, key, path);
    for (size_t i = 0; i < array.size(); ++i) {
        steps.push_back(parseSubStep(array[i],
                                     path + "." + key + "[" + std::to_string(i) + "]"));
    }
    return steps;
}

} // namespace

ActionCatalog parseActionCatalog(const nlohmann::json &root)
{
    if (!root.is_object()) {
        throw ConfigError("catalog: expected object");
    }

    ActionCatalog catalog;
    std::set<std::string> seen;
    const auto &actions = optionalArray(root, "actions", "catalog");
    for (size_t i = 0; i < actions.size(); ++i) {
        const std::string path = "catalog.actions[" + std::to_string(i) + "]";
        const auto &obj = actions[i];
        if (!obj.is_object()) {
            throw ConfigError(path + ": expected object");
        }

        ActionSpec spec;
        spec.id = requireString(obj, "id", path);
        spec.description = obj.value("description", "");
        if (!seen.insert(spec.id).second) {
            throw ConfigError(path + ".id: duplicate action '" + spec.id + "'");
        }

        const auto &preconditions = optionalArray(obj, "preconditions", path);
        for (size_t j = 0; j < preconditions.size(); ++j) {
            spec.preconditions.push_back(parsePrecondition(
                preconditions[j], path + ".preconditions[" + std::to_string(j) + "]"));
        }
        spec.apply = parseSteps(obj, "apply", path);
        spec.revert = parseSteps(obj, "revert", path);
        catalog.actions.push_back(std::move(spec));
    }

    if (root.contains("restore")) {
        const auto &restore = root.at("restore");
        if (!restore.is_object()) {
            throw ConfigError("catalog.restore: expected object");
        }
        catalog.restoreId = requireString(restore, "id", "catalog.restore");
        catalog.restoreDescription = restore.value("description", "");
        const auto &order = optionalArray(restore, "order", "catalog.restore");
        for (size_t i = 0; i < order.size(); ++i) {
            if (!order[i].is_string() || seen.count(order[i].get<std::string>()) == 0) {
                throw ConfigError("catalog.restore.order[" + std::to_string(i)
                                  + "]: expected the id of a catalog action");
            }
            catalog.restoreOrder.push_back(order[i].get<std::string>());
        }
    }
    return catalog;
}

ActionCatalog loadActionCatalog(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError("catalog: cannot read " + path.toStdString());
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError("catalog: " + path.toStdString() + ": " + ex.what());
    }

    ActionCatalog catalog = parseActionCatalog(root);
    SMLOG_INFO(QStringLiteral("ActionCatalog"),
               QStringLiteral("loadActionCatalog"),
               QStringLiteral("catalog_loaded"),
               QStringLiteral("startup"),
               QStringLiteral("json_file"),
               sysmend::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()},
                               {"actions", catalog.actions.size()},
                               {"restoreId", catalog.restoreId}}));
    return catalog;
}

void registerCatalog(ActionRegistry &registry, const ActionCatalog &catalog,
                     const std::vector<std::string> &orderOverride)
{
    for (const auto &spec : catalog.actions) {
        registry.registerAction(spec);
    }
    if (catalog.restoreId.empty()) {
        return;
    }
    const auto &order = orderOverride.empty() ? catalog.restoreOrder : orderOverride;
    registry.registerRestoreAction(catalog.restoreId, catalog.restoreDescription, order);
}

} // namespace sysmend
