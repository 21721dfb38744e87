#include "common/config.hpp"

#include <cstdint>
#include <limits>

#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace sysmend {

namespace {

constexpr int kMaxWorkers = 64;

int positiveInt(const nlohmann::json &root, const char *key, int fallback)
{
    if (!root.contains(key)) {
        return fallback;
    }
    const auto &value = root.at(key);
    const bool inRange = value.is_number_unsigned()
        ? value.get<std::uint64_t>() >= 1
            && value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : value.is_number_integer() && value.get<std::int64_t>() >= 1
            && value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!inRange) {
        throw ConfigError(std::string("config: '") + key
                          + "' must be a positive integer");
    }
    return value.get<int>();
}

int envInt(const char *name, int fallback)
{
    const QString raw = qEnvironmentVariable(name);
    if (raw.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok || value <= 0) {
        throw ConfigError(std::string(name) + " must be a positive integer");
    }
    return value;
}

std::vector<std::string> parseIdList(const nlohmann::json &value, const char *key)
{
    if (!value.is_array()) {
        throw ConfigError(std::string("config: '") + key + "' must be an array");
    }
    std::vector<std::string> ids;
    for (const auto &item : value) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            throw ConfigError(std::string("config: '") + key
                              + "' entries must be non-empty strings");
        }
        ids.push_back(item.get<std::string>());
    }
    return ids;
}

} // namespace

QString defaultConfigPath()
{
    QString base = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (base.isEmpty()) {
        base = qEnvironmentVariable("HOME") + QStringLiteral("/.config");
    }
    return base + QStringLiteral("/sysmend/config.json");
}

QString defaultCatalogPath()
{
    const QString userCatalog =
        QFileInfo(defaultConfigPath()).absolutePath() + QStringLiteral("/actions.json");
    if (QFileInfo::exists(userCatalog)) {
        return userCatalog;
    }
    return QString::fromUtf8(SYSMEND_DATA_DIR "/actions.json");
}

SysmendConfig loadConfig(const QString &path)
{
    SysmendConfig config;
    config.catalogPath = defaultCatalogPath().toStdString();

    QFile file(path);
    if (file.exists()) {
        if (!file.open(QIODevice::ReadOnly)) {
            throw ConfigError("config: cannot read " + path.toStdString());
        }

        nlohmann::json root;
        try {
            root = nlohmann::json::parse(file.readAll().toStdString());
        } catch (const nlohmann::json::parse_error &ex) {
            throw ConfigError("config: " + path.toStdString() + ": " + ex.what());
        }
        if (!root.is_object()) {
            throw ConfigError("config: top level must be an object");
        }

        config.probeTimeout = std::chrono::milliseconds(
            positiveInt(root, "probeTimeoutMs",
                        static_cast<int>(config.probeTimeout.count())));
        config.maxConcurrency = positiveInt(root, "maxConcurrency", config.maxConcurrency);
        config.cacheTtl = std::chrono::milliseconds(
            positiveInt(root, "cacheTtlMs", static_cast<int>(config.cacheTtl.count())));

        if (root.contains("restoreMode")) {
            const auto &mode = root.at("restoreMode");
            if (!mode.is_string()
                || !parseRestoreModeString(mode.get<std::string>(), &config.restoreMode)) {
                throw ConfigError("config: 'restoreMode' must be \"factory\" or \"pre_session\"");
            }
        }
        if (root.contains("restoreOrder")) {
            config.restoreOrder = parseIdList(root.at("restoreOrder"), "restoreOrder");
        }
        if (root.contains("catalog")) {
            const auto &catalog = root.at("catalog");
            if (!catalog.is_string() || catalog.get<std::string>().empty()) {
                throw ConfigError("config: 'catalog' must be a path");
            }
            config.catalogPath = catalog.get<std::string>();
        }
        if (root.contains("dryRun")) {
            if (!root.at("dryRun").is_boolean()) {
                throw ConfigError("config: 'dryRun' must be a boolean");
            }
            config.dryRun = root.at("dryRun").get<bool>();
        }
    }

    applyEnvironmentOverrides(config);

    if (config.maxConcurrency > kMaxWorkers) {
        config.maxConcurrency = kMaxWorkers;
    }

    SMLOG_DEBUG(QStringLiteral("Config"),
                QStringLiteral("loadConfig"),
                QStringLiteral("config_loaded"),
                QStringLiteral("startup"),
                file.exists() ? QStringLiteral("file_and_env") : QStringLiteral("defaults_and_env"),
                sysmend::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"path", path.toStdString()},
                                {"probeTimeoutMs", config.probeTimeout.count()},
                                {"maxConcurrency", config.maxConcurrency},
                                {"cacheTtlMs", config.cacheTtl.count()},
                                {"restoreMode", toRestoreModeString(config.restoreMode)},
                                {"catalog", config.catalogPath}}));
    return config;
}

void applyEnvironmentOverrides(SysmendConfig &config)
{
    config.probeTimeout = std::chrono::milliseconds(
        envInt("SYSMEND_PROBE_TIMEOUT_MS", static_cast<int>(config.probeTimeout.count())));
    config.maxConcurrency = envInt("SYSMEND_MAX_CONCURRENCY", config.maxConcurrency);
    config.cacheTtl = std::chrono::milliseconds(
        envInt("SYSMEND_CACHE_TTL_MS", static_cast<int>(config.cacheTtl.count())));

    const QString mode = qEnvironmentVariable("SYSMEND_RESTORE_MODE");
    if (!mode.isEmpty() && !parseRestoreModeString(mode.toStdString(), &config.restoreMode)) {
        throw ConfigError("SYSMEND_RESTORE_MODE must be factory or pre_session");
    }

    const QString catalog = qEnvironmentVariable("SYSMEND_CATALOG");
    if (!catalog.isEmpty()) {
        config.catalogPath = catalog.toStdString();
    }

    if (qEnvironmentVariableIntValue("SYSMEND_DRY_RUN") == 1) {
        config.dryRun = true;
    }
}

} // namespace sysmend
