#pragma once

#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sysmend {

class ActionRegistry;

struct ActionCatalog {
    std::vector<ActionSpec> actions;
    std::string restoreId;
    std::string restoreDescription;
    std::vector<std::string> restoreOrder;
};

// Parses {"actions": [...], "restore": {...}}. Throws ConfigError naming the
// offending path on any structural problem.
ActionCatalog parseActionCatalog(const nlohmann::json &root);
ActionCatalog loadActionCatalog(const QString &path);

// Registers every catalog action, then the restore pseudo-action using
// orderOverride when it is non-empty.
void registerCatalog(ActionRegistry &registry, const ActionCatalog &catalog,
                     const std::vector<std::string> &orderOverride = {});

} // namespace sysmend
