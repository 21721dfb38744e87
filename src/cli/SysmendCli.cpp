#include "cli/SysmendCli.hpp"

#include <iostream>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/action_catalog.hpp"
#include "system/linux_fact_source.hpp"
#include "system/linux_mutation_source.hpp"

namespace sysmend {

namespace {

constexpr int kMutationTimeoutMs = 30000;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  sysmend facts [--keys KEY,KEY] [--format markdown|json]\n"
        "  sysmend actions [--format markdown|json]\n"
        "  sysmend run ID [ID ...] [--dry-run] [--format markdown|json]\n"
        "  sysmend revert ID [--dry-run] [--format markdown|json]\n"
        "  sysmend restore [--dry-run] [--format markdown|json]\n"
        "Options:\n"
        "  --config PATH  --catalog PATH  --restore-mode factory|pre_session\n");
}

const QStringList &valueOptions()
{
    static const QStringList options = {
        QStringLiteral("--keys"),
        QStringLiteral("--format"),
        QStringLiteral("--config"),
        QStringLiteral("--catalog"),
        QStringLiteral("--restore-mode"),
    };
    return options;
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool validFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

// Arguments after the subcommand that are neither options nor option values.
std::vector<std::string> positionalArgs(const QStringList &args)
{
    std::vector<std::string> out;
    for (int i = 2; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (valueOptions().contains(arg)) {
            ++i;
            continue;
        }
        if (arg.startsWith(QStringLiteral("--"))) {
            continue;
        }
        out.push_back(arg.toStdString());
    }
    return out;
}

std::string displayValue(const Fact &fact)
{
    if (!fact.ok()) {
        return "(error: " + *fact.error() + ")";
    }
    const nlohmann::json value = factValueToJson(fact.value());
    if (value.is_null()) {
        return fact.hasValue() ? "unknown" : "(absent)";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_array()) {
        std::string joined;
        for (const auto &item : value) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += item.get<std::string>();
        }
        return joined.empty() ? "(none)" : joined;
    }
    return value.dump();
}

void renderFactsMarkdown(const Snapshot &snapshot)
{
    std::cout << "# System Facts\n\n";
    std::cout << "Snapshot: " << snapshot.id() << "\n";
    std::cout << "Captured: " << toIso8601Utc(snapshot.capturedAt()) << "\n\n";
    for (const auto &item : snapshot.facts()) {
        std::cout << "- " << item.first << ": " << displayValue(item.second) << "\n";
    }
}

void renderActionsMarkdown(const std::vector<ActionSummary> &actions)
{
    std::cout << "# Actions\n\n";
    if (actions.empty()) {
        std::cout << "No actions registered.\n";
        return;
    }
    for (const auto &action : actions) {
        std::cout << "- " << action.id;
        if (!action.description.empty()) {
            std::cout << ": " << action.description;
        }
        std::cout << "\n";
    }
}

void renderResultMarkdown(const ActionResult &result)
{
    std::cout << "## " << result.actionId << " [" << toActionStatusString(result.status)
              << "]\n\n";
    if (!result.detail.empty()) {
        std::cout << result.detail << "\n\n";
    }
    for (const auto &step : result.subStepResults) {
        std::cout << "- " << step.name << " (" << step.operation << "): "
                  << toSubStepStatusString(step.status);
        if (!step.detail.empty()) {
            std::cout << " - " << step.detail;
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

bool isClean(const ActionResult &result)
{
    return result.status == ActionStatus::Success
        || result.status == ActionStatus::SkippedPrecondition;
}

} // namespace

SysmendCli::SysmendCli() = default;

SysmendCli::SysmendCli(FactSource facts, std::vector<DerivedFact> derived,
                       MutationSource mutations)
    : m_factOverride(std::move(facts))
    , m_derivedOverride(std::move(derived))
    , m_mutationOverride(std::move(mutations))
{
}

SysmendCli::~SysmendCli() = default;

int SysmendCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    SMLOG_INFO(QStringLiteral("SysmendCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               sysmend::logging::defaultWho(),
               QString(),
               nlohmann::json{{"command", command.toStdString()}});

    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    if (command == QStringLiteral("facts")) {
        return runFacts(args);
    }
    if (command == QStringLiteral("actions")) {
        return runActions(args);
    }
    if (command == QStringLiteral("run")) {
        return runExecute(args);
    }
    if (command == QStringLiteral("revert")) {
        return runRevert(args);
    }
    if (command == QStringLiteral("restore")) {
        return runRestore(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

bool SysmendCli::prepare(const QStringList &args, bool needsRegistry)
{
    try {
        const QString configPath = getArgValue(args, QStringLiteral("--config"));
        m_config = loadConfig(configPath.isEmpty() ? defaultConfigPath() : configPath);

        const QString catalogPath = getArgValue(args, QStringLiteral("--catalog"));
        if (!catalogPath.isEmpty()) {
            m_config.catalogPath = catalogPath.toStdString();
        }
        const QString mode = getArgValue(args, QStringLiteral("--restore-mode"));
        if (!mode.isEmpty() && !parseRestoreModeString(mode.toStdString(), &m_config.restoreMode)) {
            throw ConfigError("--restore-mode must be factory or pre_session");
        }
        if (args.contains(QStringLiteral("--dry-run"))) {
            m_config.dryRun = true;
        }

        ProberOptions options;
        options.maxConcurrency = m_config.maxConcurrency;
        options.probeTimeout = m_config.probeTimeout;
        if (m_factOverride.has_value()) {
            m_prober = std::make_unique<FactProber>(*m_factOverride, m_derivedOverride, options);
        } else {
            m_prober = std::make_unique<FactProber>(
                makeLinuxFactSource(static_cast<int>(m_config.probeTimeout.count())),
                makeLinuxDerivedFacts(), options);
        }

        if (!needsRegistry) {
            return true;
        }

        MutationSource mutations = m_mutationOverride.has_value()
            ? *m_mutationOverride
            : makeLinuxMutationSource(kMutationTimeoutMs);
        if (m_config.dryRun) {
            mutations = makeDryRunSource(mutations);
        }
        m_registry = std::make_unique<ActionRegistry>(std::move(mutations), m_config.restoreMode);

        const ActionCatalog catalog =
            loadActionCatalog(QString::fromStdString(m_config.catalogPath));
        registerCatalog(*m_registry, catalog, m_config.restoreOrder);
        m_restoreId = catalog.restoreId;
        return true;
    } catch (const SysmendError &ex) {
        SMLOG_ERROR(QStringLiteral("SysmendCli"),
                    QStringLiteral("prepare"),
                    QStringLiteral("setup_failed"),
                    QStringLiteral("invalid_configuration"),
                    QStringLiteral("abort_command"),
                    sysmend::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        std::cerr << "Error: " << ex.what() << std::endl;
        return false;
    }
}

SnapshotPtr SysmendCli::currentSnapshot()
{
    return m_prober->getCached(m_prober->availableKeys(), m_config.cacheTtl);
}

int SysmendCli::runFacts(const QStringList &args)
{
    if (!prepare(args, false)) {
        return 1;
    }

    std::set<std::string> keys;
    const QString keyList = getArgValue(args, QStringLiteral("--keys"));
    if (keyList.isEmpty()) {
        keys = m_prober->availableKeys();
    } else {
        for (const QString &key : keyList.split(QChar(','), Qt::SkipEmptyParts)) {
            keys.insert(key.trimmed().toStdString());
        }
    }

    const SnapshotPtr snapshot = m_prober->probe(keys, m_config.probeTimeout);
    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << nlohmann::json(*snapshot).dump(2) << std::endl;
    } else {
        renderFactsMarkdown(*snapshot);
    }
    return 0;
}

int SysmendCli::runActions(const QStringList &args)
{
    if (!prepare(args, true)) {
        return 1;
    }

    const auto actions = m_registry->listActions();
    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << nlohmann::json(actions).dump(2) << std::endl;
    } else {
        renderActionsMarkdown(actions);
    }
    return 0;
}

int SysmendCli::runExecute(const QStringList &args)
{
    const std::vector<std::string> ids = positionalArgs(args);
    if (ids.empty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (!prepare(args, true)) {
        return 1;
    }

    BatchResult batch;
    try {
        const SnapshotPtr snapshot = currentSnapshot();
        batch = m_registry->executeBatch(ids, *snapshot, &m_cancel);
    } catch (const UnknownActionError &ex) {
        std::cerr << "Unknown action: " << ex.actionId() << std::endl;
        return 1;
    }

    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << nlohmann::json(batch).dump(2) << std::endl;
    } else {
        std::cout << "# Batch Result\n\n";
        if (m_config.dryRun) {
            std::cout << "Dry run: no changes were made.\n\n";
        }
        for (const auto &result : batch.results) {
            renderResultMarkdown(result);
        }
    }

    for (const auto &result : batch.results) {
        if (!isClean(result)) {
            return 2;
        }
    }
    return 0;
}

int SysmendCli::runRevert(const QStringList &args)
{
    const std::vector<std::string> ids = positionalArgs(args);
    if (ids.size() != 1) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (!prepare(args, true)) {
        return 1;
    }

    ActionResult result;
    try {
        result = m_registry->revert(ids.front(), &m_cancel);
    } catch (const UnknownActionError &ex) {
        std::cerr << "Unknown action: " << ex.actionId() << std::endl;
        return 1;
    }

    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << nlohmann::json(result).dump(2) << std::endl;
    } else {
        renderResultMarkdown(result);
    }
    return isClean(result) ? 0 : 2;
}

int SysmendCli::runRestore(const QStringList &args)
{
    if (!prepare(args, true)) {
        return 1;
    }
    if (m_restoreId.empty()) {
        std::cerr << "The action catalog declares no restore action." << std::endl;
        return 1;
    }
    const SnapshotPtr snapshot = currentSnapshot();
    const ActionResult result = m_registry->execute(m_restoreId, *snapshot, &m_cancel);
    if (getFormat(args) == QStringLiteral("json")) {
        std::cout << nlohmann::json(result).dump(2) << std::endl;
    } else {
        renderResultMarkdown(result);
    }
    return isClean(result) ? 0 : 2;
}

} // namespace sysmend
