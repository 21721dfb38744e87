#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <QString>

#include "common/enums.hpp"

namespace sysmend {

struct SysmendConfig {
    std::chrono::milliseconds probeTimeout{5000};
    int maxConcurrency = 8;
    std::chrono::milliseconds cacheTtl{30000};
    RestoreMode restoreMode = RestoreMode::PreSession;
    // Overrides the restore order declared by the catalog when non-empty.
    std::vector<std::string> restoreOrder;
    std::string catalogPath;
    bool dryRun = false;
};

QString defaultConfigPath();
QString defaultCatalogPath();

// Reads the JSON config file (a missing file yields defaults) and applies
// SYSMEND_* environment overrides. Throws ConfigError on malformed input.
SysmendConfig loadConfig(const QString &path);

void applyEnvironmentOverrides(SysmendConfig &config);

} // namespace sysmend
