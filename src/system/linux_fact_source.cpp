#include "system/linux_fact_source.hpp"

#include <algorithm>
#include <stdexcept>

#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>

#include <unistd.h>

#include "system/command_runner.hpp"

namespace sysmend {

namespace {

constexpr const char *kSecureBootVar =
    "/sys/firmware/efi/efivars/SecureBoot-8be4df61-93ca-11d2-aa0d-00e098032b8c";

QString readTextFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw std::runtime_error("cannot read " + path.toStdString() + ": "
                                 + file.errorString().toStdString());
    }
    return QString::fromUtf8(file.readAll());
}

std::string readFirstLine(const QString &path)
{
    const QString text = readTextFile(path).trimmed();
    if (text.isEmpty()) {
        throw std::runtime_error(path.toStdString() + " is empty");
    }
    return text.section(QChar('\n'), 0, 0).trimmed().toStdString();
}

// First "name : value" entry of a /proc style key-value file.
QString procField(const QString &text, const QString &name)
{
    for (const QString &line : text.split(QChar('\n'))) {
        const int colon = line.indexOf(QChar(':'));
        if (colon < 0) {
            continue;
        }
        if (line.left(colon).trimmed() == name) {
            return line.mid(colon + 1).trimmed();
        }
    }
    return {};
}

QString osReleaseField(const QString &text, const QString &name)
{
    for (const QString &line : text.split(QChar('\n'))) {
        if (!line.startsWith(name + QChar('='))) {
            continue;
        }
        QString value = line.mid(name.size() + 1).trimmed();
        if (value.size() >= 2 && (value.startsWith(QChar('"')) || value.startsWith(QChar('\'')))) {
            value = value.mid(1, value.size() - 2);
        }
        return value;
    }
    return {};
}

std::string stringInput(const FactMap &inputs, const std::string &key)
{
    const std::string *text = inputs.at(key).asString();
    if (!text) {
        throw std::runtime_error(key + " is not a string");
    }
    return *text;
}

// Command budget for a query: the configured timeout, cut down to whatever
// is left of the enclosing probe's deadline.
int commandBudgetMs(int commandTimeoutMs)
{
    const auto remaining = remainingProbeTime();
    if (!remaining) {
        return commandTimeoutMs;
    }
    return std::max(1, std::min(commandTimeoutMs, static_cast<int>(remaining->count())));
}

} // namespace

const PatternTable &gpuVendorTable()
{
    static const PatternTable table({
        {R"(nvidia|geforce|quadro|tesla)", "nvidia"},
        {R"(advanced micro devices|\bamd\b|\bati\b|radeon)", "amd"},
        {R"(intel)", "intel"},
        {R"(virtio|vmware svga|qxl|bochs|cirrus|hyper-v|virtualbox)", "virtual"},
    }, "unknown");
    return table;
}

const PatternTable &cpuVendorTable()
{
    static const PatternTable table({
        {R"(intel)", "intel"},
        {R"(\bamd\b|ryzen|epyc|athlon|threadripper)", "amd"},
        {R"(\barm\b|cortex|neoverse|apple m\d)", "arm"},
    }, "unknown");
    return table;
}

const PatternTable &virtualPlatformTable()
{
    static const PatternTable table({
        {R"(vmware)", "vmware"},
        {R"(virtualbox|innotek)", "virtualbox"},
        {R"(qemu|\bkvm\b|bochs)", "kvm"},
        {R"(microsoft corporation.*virtual|hyper-v)", "hyperv"},
        {R"(\bxen\b)", "xen"},
        {R"(parallels)", "parallels"},
        {R"(amazon ec2)", "aws"},
        {R"(google compute engine)", "gce"},
    }, "physical");
    return table;
}

FactSource makeLinuxFactSource(int commandTimeoutMs)
{
    FactSource source;

    source["kernel_version"] = [commandTimeoutMs]() -> FactValue {
        return runCommandChecked(QStringLiteral("uname"), {QStringLiteral("-r")},
                                 commandBudgetMs(commandTimeoutMs))
            .toStdString();
    };

    source["os_name"] = []() -> FactValue {
        const QString name = osReleaseField(readTextFile(QStringLiteral("/etc/os-release")),
                                            QStringLiteral("PRETTY_NAME"));
        if (name.isEmpty()) {
            return std::monostate{};
        }
        return name.toStdString();
    };

    source["firmware_type"] = []() -> FactValue {
        return std::string(QFileInfo::exists(QStringLiteral("/sys/firmware/efi")) ? "uefi"
                                                                                   : "bios");
    };

    source["secure_boot"] = []() -> FactValue {
        QFile file(QString::fromLatin1(kSecureBootVar));
        if (!file.exists()) {
            return std::optional<bool>();
        }
        if (!file.open(QIODevice::ReadOnly)) {
            return std::optional<bool>();
        }
        // efivarfs prefixes the payload with 4 attribute bytes.
        const QByteArray data = file.readAll();
        if (data.size() < 5) {
            return std::optional<bool>();
        }
        return std::optional<bool>(data.at(4) == 1);
    };

    source["process_uid"] = []() -> FactValue {
        return std::to_string(geteuid());
    };

    source["system_manufacturer"] = []() -> FactValue {
        return readFirstLine(QStringLiteral("/sys/class/dmi/id/sys_vendor"));
    };

    source["system_model"] = []() -> FactValue {
        return readFirstLine(QStringLiteral("/sys/class/dmi/id/product_name"));
    };

    source["cpu_model"] = []() -> FactValue {
        const QString text = readTextFile(QStringLiteral("/proc/cpuinfo"));
        QString model = procField(text, QStringLiteral("model name"));
        if (model.isEmpty()) {
            model = procField(text, QStringLiteral("Model"));
        }
        if (model.isEmpty()) {
            return std::monostate{};
        }
        return model.toStdString();
    };

    source["cpu_hypervisor_flag"] = []() -> FactValue {
        const QString flags = procField(readTextFile(QStringLiteral("/proc/cpuinfo")),
                                        QStringLiteral("flags"));
        return flags.split(QChar(' '), Qt::SkipEmptyParts).contains(QStringLiteral("hypervisor"));
    };

    source["memory_total_kb"] = []() -> FactValue {
        const QString value = procField(readTextFile(QStringLiteral("/proc/meminfo")),
                                        QStringLiteral("MemTotal"));
        const QString number = value.section(QChar(' '), 0, 0);
        if (number.isEmpty()) {
            throw std::runtime_error("MemTotal missing from /proc/meminfo");
        }
        return number.toStdString();
    };

    source["gpu_list"] = [commandTimeoutMs]() -> FactValue {
        const QString output = runCommandChecked(QStringLiteral("lspci"), {},
                                                 commandBudgetMs(commandTimeoutMs));
        static const QRegularExpression kDisplayClass(
            QStringLiteral("^\\S+\\s+(VGA compatible controller|3D controller|Display controller):\\s*(.*)$"));
        std::vector<std::string> gpus;
        for (const QString &line : output.split(QChar('\n'), Qt::SkipEmptyParts)) {
            const QRegularExpressionMatch match = kDisplayClass.match(line.trimmed());
            if (match.hasMatch()) {
                gpus.push_back(match.captured(2).trimmed().toStdString());
            }
        }
        return gpus;
    };

    source["dns_servers"] = []() -> FactValue {
        std::vector<std::string> servers;
        for (const QString &line : readTextFile(QStringLiteral("/etc/resolv.conf"))
                                       .split(QChar('\n'), Qt::SkipEmptyParts)) {
            const QStringList tokens = line.simplified().split(QChar(' '));
            if (tokens.size() >= 2 && tokens.at(0) == QStringLiteral("nameserver")) {
                servers.push_back(tokens.at(1).toStdString());
            }
        }
        return servers;
    };

    return source;
}

std::vector<DerivedFact> makeLinuxDerivedFacts()
{
    std::vector<DerivedFact> derived;

    derived.push_back(DerivedFact{
        "is_admin",
        {"process_uid"},
        [](const FactMap &inputs) -> FactValue {
            return stringInput(inputs, "process_uid") == "0";
        }});

    derived.push_back(DerivedFact{
        "is_virtual_machine",
        {"cpu_hypervisor_flag", "system_manufacturer", "system_model"},
        [](const FactMap &inputs) -> FactValue {
            const auto hypervisor = inputs.at("cpu_hypervisor_flag").asBool();
            if (!hypervisor.has_value()) {
                throw std::runtime_error("cpu_hypervisor_flag is not a boolean");
            }
            const std::string platform = stringInput(inputs, "system_manufacturer") + " "
                + stringInput(inputs, "system_model");
            return *hypervisor || virtualPlatformTable().matchesAny(platform);
        }});

    derived.push_back(DerivedFact{
        "gpu_vendor",
        {"gpu_list"},
        [](const FactMap &inputs) -> FactValue {
            const auto *gpus = inputs.at("gpu_list").asList();
            if (!gpus) {
                throw std::runtime_error("gpu_list is not a list");
            }
            return gpuVendorTable().classifyAny(*gpus);
        }});

    derived.push_back(DerivedFact{
        "cpu_vendor",
        {"cpu_model"},
        [](const FactMap &inputs) -> FactValue {
            return cpuVendorTable().classify(stringInput(inputs, "cpu_model"));
        }});

    return derived;
}

} // namespace sysmend
