#include "system/linux_mutation_source.hpp"

#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>
#include <QStringList>

#include "system/command_runner.hpp"

namespace sysmend {

namespace {

constexpr const char *kCpuRoot = "/sys/devices/system/cpu";

QString requireArg(const nlohmann::json &args, const char *name)
{
    if (!args.is_object() || !args.contains(name) || !args.at(name).is_string()
        || args.at(name).get<std::string>().empty()) {
        throw std::invalid_argument(std::string("missing string argument '") + name + "'");
    }
    return QString::fromStdString(args.at(name).get<std::string>());
}

QString requireOneOf(const nlohmann::json &args, const char *name, const QStringList &allowed)
{
    const QString value = requireArg(args, name);
    if (!allowed.contains(value)) {
        throw std::invalid_argument(std::string("argument '") + name + "' must be one of "
                                    + allowed.join(QStringLiteral(", ")).toStdString());
    }
    return value;
}

QString readTrimmed(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw std::runtime_error("cannot read " + path.toStdString() + ": "
                                 + file.errorString().toStdString());
    }
    return QString::fromUtf8(file.readAll()).simplified();
}

void writeValue(const QString &path, const QString &value)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        throw std::runtime_error("cannot open " + path.toStdString() + ": "
                                 + file.errorString().toStdString());
    }
    const QByteArray data = value.toUtf8() + '\n';
    if (file.write(data) != data.size()) {
        throw std::runtime_error("short write to " + path.toStdString() + ": "
                                 + file.errorString().toStdString());
    }
}

QString sysctlPath(const QString &key)
{
    if (key.contains(QStringLiteral("..")) || key.startsWith(QChar('/'))) {
        throw std::invalid_argument("invalid sysctl key " + key.toStdString());
    }
    QString relative = key;
    relative.replace(QChar('.'), QChar('/'));
    return QStringLiteral("/proc/sys/") + relative;
}

QStringList governorPaths()
{
    QStringList paths;
    const QDir root(QString::fromLatin1(kCpuRoot));
    const QStringList cpus = root.entryList({QStringLiteral("cpu[0-9]*")}, QDir::Dirs);
    for (const QString &cpu : cpus) {
        const QString path = root.filePath(cpu + QStringLiteral("/cpufreq/scaling_governor"));
        if (QFileInfo::exists(path)) {
            paths.push_back(path);
        }
    }
    if (paths.isEmpty()) {
        throw std::runtime_error("no cpufreq scaling governors exposed");
    }
    return paths;
}

std::optional<nlohmann::json> toJson(const std::optional<std::string> &value)
{
    if (!value) {
        return std::nullopt;
    }
    return nlohmann::json(*value);
}

} // namespace

std::optional<std::string> normalizeActiveState(const QString &state)
{
    const QString trimmed = state.trimmed();
    if (trimmed == QStringLiteral("active") || trimmed == QStringLiteral("reloading")
        || trimmed == QStringLiteral("activating")) {
        return std::string("active");
    }
    if (trimmed == QStringLiteral("inactive") || trimmed == QStringLiteral("failed")
        || trimmed == QStringLiteral("deactivating")) {
        return std::string("inactive");
    }
    return std::nullopt;
}

std::optional<std::string> normalizeEnabledState(const QString &state)
{
    const QString trimmed = state.trimmed();
    if (trimmed == QStringLiteral("enabled") || trimmed == QStringLiteral("enabled-runtime")) {
        return std::string("enabled");
    }
    if (trimmed == QStringLiteral("disabled")) {
        return std::string("disabled");
    }
    // static, masked, indirect and generated units cannot be toggled back.
    return std::nullopt;
}

// Parses "Default: deny (incoming), allow (outgoing), disabled (routed)".
// "disabled" means forwarding is off in the kernel, which ufw default
// cannot set, so it reads as unknown.
std::optional<std::string> ufwDefaultPolicy(const QString &status, const QString &direction)
{
    static const QStringList kPolicies{QStringLiteral("allow"), QStringLiteral("deny"),
                                       QStringLiteral("reject")};
    const QRegularExpression pattern(QStringLiteral("(\\w+) \\(%1\\)")
                                         .arg(QRegularExpression::escape(direction)));
    for (const QString &line : status.split(QChar('\n'))) {
        if (!line.trimmed().startsWith(QStringLiteral("Default:"))) {
            continue;
        }
        const QRegularExpressionMatch match = pattern.match(line);
        if (match.hasMatch() && kPolicies.contains(match.captured(1))) {
            return match.captured(1).toStdString();
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<std::string> commonGovernor(const QStringList &governors)
{
    if (governors.isEmpty()) {
        return std::nullopt;
    }
    for (const QString &governor : governors) {
        if (governor != governors.first()) {
            return std::nullopt;
        }
    }
    return governors.first().toStdString();
}

MutationSource makeLinuxMutationSource(int commandTimeoutMs)
{
    MutationSource source;

    source["sysctl.set"] = MutationOp{
        [](const nlohmann::json &args) {
            writeValue(sysctlPath(requireArg(args, "key")), requireArg(args, "value"));
        },
        [](const nlohmann::json &args) -> std::optional<nlohmann::json> {
            return nlohmann::json(readTrimmed(sysctlPath(requireArg(args, "key"))).toStdString());
        }};

    source["service.set_enabled"] = MutationOp{
        [commandTimeoutMs](const nlohmann::json &args) {
            const QString value = requireOneOf(args, "value",
                                               {QStringLiteral("enabled"), QStringLiteral("disabled")});
            const QString verb = value == QStringLiteral("enabled") ? QStringLiteral("enable")
                                                                    : QStringLiteral("disable");
            runCommandChecked(QStringLiteral("systemctl"), {verb, requireArg(args, "unit")},
                              commandTimeoutMs);
        },
        [commandTimeoutMs](const nlohmann::json &args) -> std::optional<nlohmann::json> {
            // is-enabled exits non-zero for disabled units but still prints the state.
            const CommandResult result = runCommand(
                QStringLiteral("systemctl"), {QStringLiteral("is-enabled"), requireArg(args, "unit")},
                commandTimeoutMs);
            if (!result.started || result.timedOut) {
                return std::nullopt;
            }
            return toJson(normalizeEnabledState(result.standardOutput));
        }};

    source["service.set_active"] = MutationOp{
        [commandTimeoutMs](const nlohmann::json &args) {
            const QString value = requireOneOf(args, "value",
                                               {QStringLiteral("active"), QStringLiteral("inactive")});
            const QString verb = value == QStringLiteral("active") ? QStringLiteral("start")
                                                                   : QStringLiteral("stop");
            runCommandChecked(QStringLiteral("systemctl"), {verb, requireArg(args, "unit")},
                              commandTimeoutMs);
        },
        [commandTimeoutMs](const nlohmann::json &args) -> std::optional<nlohmann::json> {
            const CommandResult result = runCommand(
                QStringLiteral("systemctl"), {QStringLiteral("is-active"), requireArg(args, "unit")},
                commandTimeoutMs);
            if (!result.started || result.timedOut) {
                return std::nullopt;
            }
            return toJson(normalizeActiveState(result.standardOutput));
        }};

    source["service.restart"] = MutationOp{
        [commandTimeoutMs](const nlohmann::json &args) {
            runCommandChecked(QStringLiteral("systemctl"),
                              {QStringLiteral("restart"), requireArg(args, "unit")},
                              commandTimeoutMs);
        },
        nullptr};

    source["firewall.set_default"] = MutationOp{
        [commandTimeoutMs](const nlohmann::json &args) {
            const QString direction = requireOneOf(
                args, "direction",
                {QStringLiteral("incoming"), QStringLiteral("outgoing"), QStringLiteral("routed")});
            const QString policy = requireOneOf(
                args, "value",
                {QStringLiteral("allow"), QStringLiteral("deny"), QStringLiteral("reject")});
            runCommandChecked(QStringLiteral("ufw"), {QStringLiteral("default"), policy, direction},
                              commandTimeoutMs);
        },
        [commandTimeoutMs](const nlohmann::json &args) -> std::optional<nlohmann::json> {
            const QString status = runCommandChecked(
                QStringLiteral("ufw"), {QStringLiteral("status"), QStringLiteral("verbose")},
                commandTimeoutMs);
            return toJson(ufwDefaultPolicy(status, requireArg(args, "direction")));
        }};

    source["dns.set"] = MutationOp{
        [commandTimeoutMs](const nlohmann::json &args) {
            const QString link = requireArg(args, "link");
            if (!args.contains("value") || !args.at("value").is_array()) {
                throw std::invalid_argument("argument 'value' must be a list of servers");
            }
            QStringList servers;
            for (const auto &server : args.at("value")) {
                if (!server.is_string()) {
                    throw std::invalid_argument("dns servers must be strings");
                }
                servers.push_back(QString::fromStdString(server.get<std::string>()));
            }
            if (servers.isEmpty()) {
                runCommandChecked(QStringLiteral("resolvectl"), {QStringLiteral("revert"), link},
                                  commandTimeoutMs);
                return;
            }
            runCommandChecked(QStringLiteral("resolvectl"),
                              QStringList{QStringLiteral("dns"), link} + servers,
                              commandTimeoutMs);
        },
        [commandTimeoutMs](const nlohmann::json &args) -> std::optional<nlohmann::json> {
            // "Link 2 (eth0): 1.1.1.1 9.9.9.9"
            const QString output = runCommandChecked(
                QStringLiteral("resolvectl"), {QStringLiteral("dns"), requireArg(args, "link")},
                commandTimeoutMs);
            const int colon = output.indexOf(QStringLiteral("):"));
            if (colon < 0) {
                return std::nullopt;
            }
            std::vector<std::string> servers;
            for (const QString &server :
                 output.mid(colon + 2).split(QChar(' '), Qt::SkipEmptyParts)) {
                servers.push_back(server.toStdString());
            }
            return nlohmann::json(servers);
        }};

    source["cpu.set_governor"] = MutationOp{
        [](const nlohmann::json &args) {
            const QString governor = requireArg(args, "value");
            for (const QString &path : governorPaths()) {
                writeValue(path, governor);
            }
        },
        [](const nlohmann::json &) -> std::optional<nlohmann::json> {
            QStringList governors;
            for (const QString &path : governorPaths()) {
                governors.push_back(readTrimmed(path));
            }
            return toJson(commonGovernor(governors));
        }};

    source["file.write"] = MutationOp{
        [](const nlohmann::json &args) {
            const QString path = requireArg(args, "path");
            if (!args.contains("value") || args.at("value").is_null()) {
                if (QFileInfo::exists(path) && !QFile::remove(path)) {
                    throw std::runtime_error("cannot remove " + path.toStdString());
                }
                return;
            }
            if (!args.at("value").is_string()) {
                throw std::invalid_argument("argument 'value' must be a string or null");
            }
            QDir().mkpath(QFileInfo(path).absolutePath());
            QSaveFile file(path);
            if (!file.open(QIODevice::WriteOnly)) {
                throw std::runtime_error("cannot open " + path.toStdString() + ": "
                                         + file.errorString().toStdString());
            }
            file.write(QByteArray::fromStdString(args.at("value").get<std::string>()));
            if (!file.commit()) {
                throw std::runtime_error("cannot write " + path.toStdString() + ": "
                                         + file.errorString().toStdString());
            }
        },
        [](const nlohmann::json &args) -> std::optional<nlohmann::json> {
            const QString path = requireArg(args, "path");
            QFile file(path);
            if (!file.exists()) {
                return nlohmann::json(nullptr);
            }
            if (!file.open(QIODevice::ReadOnly)) {
                return std::nullopt;
            }
            return nlohmann::json(file.readAll().toStdString());
        }};

    return source;
}

} // namespace sysmend
