#include <QtTest/QtTest>

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <unistd.h>

#include "core/fact_prober.hpp"
#include "system/command_runner.hpp"
#include "system/linux_fact_source.hpp"
#include "system/linux_mutation_source.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

class LinuxSourcesTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testCommandRunnerExitCodes();
    void testCommandRunnerTimeout();
    void testCommandRunnerMissingProgram();
    void testHostFactsResolve();
    void testDerivedFactsFromFakeInputs();
    void testVirtualMachineFromPlatformName();
    void testFileWriteOperation();
    void testSysctlRejectsPathEscape();
    void testDryRunSourceKeepsReads();
    void testServiceStatesFoldOntoApplyValues();
    void testUfwPolicyOnlyReportsSettableValues();
    void testGovernorReadRequiresAgreement();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void LinuxSourcesTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LinuxSourcesTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void LinuxSourcesTests::testCommandRunnerExitCodes()
{
    const auto ok = sysmend::runCommand(QStringLiteral("sh"),
                                        {QStringLiteral("-c"), QStringLiteral("echo ' hello '")},
                                        5000);
    QVERIFY(ok.ok());
    QCOMPARE(ok.standardOutput, QStringLiteral("hello"));

    const auto failed = sysmend::runCommand(
        QStringLiteral("sh"), {QStringLiteral("-c"), QStringLiteral("echo oops >&2; exit 3")}, 5000);
    QVERIFY(failed.started);
    QVERIFY(!failed.ok());
    QCOMPARE(failed.exitCode, 3);
    QCOMPARE(failed.standardError, QStringLiteral("oops"));

    bool threw = false;
    try {
        sysmend::runCommandChecked(QStringLiteral("sh"),
                                   {QStringLiteral("-c"), QStringLiteral("echo oops >&2; exit 3")},
                                   5000);
    } catch (const std::runtime_error &ex) {
        threw = true;
        QVERIFY(QString::fromUtf8(ex.what()).contains(QStringLiteral("exited with 3: oops")));
    }
    QVERIFY(threw);
}

void LinuxSourcesTests::testCommandRunnerTimeout()
{
    const auto started = std::chrono::steady_clock::now();
    const auto result = sysmend::runCommand(QStringLiteral("sleep"), {QStringLiteral("5")}, 200);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    QVERIFY(result.timedOut);
    QVERIFY(!result.ok());
    QVERIFY(elapsed < 3s);
}

void LinuxSourcesTests::testCommandRunnerMissingProgram()
{
    const auto result = sysmend::runCommand(QStringLiteral("sysmend-no-such-program"), {}, 2000);
    QVERIFY(!result.started);
    QVERIFY(!result.ok());
}

void LinuxSourcesTests::testHostFactsResolve()
{
    sysmend::ProberOptions options;
    options.maxConcurrency = 4;
    sysmend::FactProber prober(sysmend::makeLinuxFactSource(5000),
                               sysmend::makeLinuxDerivedFacts(), options);

    const auto snapshot = prober.probe({"kernel_version", "firmware_type", "process_uid",
                                        "memory_total_kb", "is_admin"},
                                       10s);

    const sysmend::Fact *kernel = snapshot->find("kernel_version");
    QVERIFY(kernel && kernel->ok());
    QVERIFY(!kernel->asString()->empty());

    const std::string firmware = *snapshot->find("firmware_type")->asString();
    QVERIFY(firmware == "uefi" || firmware == "bios");

    QCOMPARE(QString::fromStdString(*snapshot->find("process_uid")->asString()),
             QString::number(geteuid()));
    QVERIFY(snapshot->find("is_admin")->asBool() == std::optional<bool>(geteuid() == 0));
    QVERIFY(std::stoll(*snapshot->find("memory_total_kb")->asString()) > 0);
}

void LinuxSourcesTests::testDerivedFactsFromFakeInputs()
{
    sysmend::FactSource source;
    source["process_uid"] = [] { return sysmend::FactValue(std::string("1000")); };
    source["cpu_model"] = [] {
        return sysmend::FactValue(std::string("AMD Ryzen 9 7950X 16-Core Processor"));
    };
    source["gpu_list"] = [] {
        return sysmend::FactValue(std::vector<std::string>{
            "ASPEED Technology, Inc. ASPEED Graphics Family",
            "NVIDIA Corporation AD102 [GeForce RTX 4090]"});
    };
    source["cpu_hypervisor_flag"] = [] { return sysmend::FactValue(false); };
    source["system_manufacturer"] = [] { return sysmend::FactValue(std::string("ASUS")); };
    source["system_model"] = [] { return sysmend::FactValue(std::string("ProArt X670E")); };

    sysmend::FactProber prober(source, sysmend::makeLinuxDerivedFacts(), sysmend::ProberOptions());
    const auto snapshot = prober.probe({"is_admin", "cpu_vendor", "gpu_vendor",
                                        "is_virtual_machine"},
                                       2s);

    QVERIFY(snapshot->find("is_admin")->asBool() == std::optional<bool>(false));
    QCOMPARE(QString::fromStdString(*snapshot->find("cpu_vendor")->asString()),
             QStringLiteral("amd"));
    QCOMPARE(QString::fromStdString(*snapshot->find("gpu_vendor")->asString()),
             QStringLiteral("nvidia"));
    QVERIFY(snapshot->find("is_virtual_machine")->asBool() == std::optional<bool>(false));
}

void LinuxSourcesTests::testVirtualMachineFromPlatformName()
{
    sysmend::FactSource source;
    source["cpu_hypervisor_flag"] = [] { return sysmend::FactValue(false); };
    source["system_manufacturer"] = [] { return sysmend::FactValue(std::string("QEMU")); };
    source["system_model"] = [] {
        return sysmend::FactValue(std::string("Standard PC (Q35 + ICH9, 2009)"));
    };

    sysmend::FactProber prober(source, sysmend::makeLinuxDerivedFacts(), sysmend::ProberOptions());
    const auto snapshot = prober.probe({"is_virtual_machine"}, 2s);
    QVERIFY(snapshot->find("is_virtual_machine")->asBool() == std::optional<bool>(true));
}

void LinuxSourcesTests::testFileWriteOperation()
{
    const sysmend::MutationSource ops = sysmend::makeLinuxMutationSource(5000);
    const sysmend::MutationOp &op = ops.at("file.write");
    const std::string path = (m_tempDir.path() + QStringLiteral("/conf.d/50-test.conf")).toStdString();

    QVERIFY(op.read(nlohmann::json{{"path", path}}) == std::optional<nlohmann::json>(nullptr));

    op.apply(nlohmann::json{{"path", path}, {"value", "[Resolve]\nDNS=9.9.9.9\n"}});
    QVERIFY(QFileInfo::exists(QString::fromStdString(path)));
    QVERIFY(*op.read(nlohmann::json{{"path", path}}) == nlohmann::json("[Resolve]\nDNS=9.9.9.9\n"));

    op.apply(nlohmann::json{{"path", path}, {"value", nullptr}});
    QVERIFY(!QFileInfo::exists(QString::fromStdString(path)));

    bool threw = false;
    try {
        op.apply(nlohmann::json{{"path", path}, {"value", 5}});
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    QVERIFY(threw);
}

void LinuxSourcesTests::testSysctlRejectsPathEscape()
{
    const sysmend::MutationSource ops = sysmend::makeLinuxMutationSource(5000);
    bool threw = false;
    try {
        ops.at("sysctl.set").apply(nlohmann::json{{"key", "../../etc/passwd"}, {"value", "x"}});
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    QVERIFY(threw);
}

void LinuxSourcesTests::testDryRunSourceKeepsReads()
{
    sysmend::testing::FakeSystem system;
    system.set("knob", "slow");
    const sysmend::MutationSource dryRun = sysmend::makeDryRunSource(system.source());

    const nlohmann::json args{{"key", "knob"}, {"value", "fast"}};
    dryRun.at("kv.set").apply(args);
    QVERIFY(system.calls().empty());
    QVERIFY(system.get("knob") == nlohmann::json("slow"));
    QVERIFY(*dryRun.at("kv.set").read(args) == nlohmann::json("slow"));
    QVERIFY(!dryRun.at("kv.touch").read);
}

void LinuxSourcesTests::testServiceStatesFoldOntoApplyValues()
{
    QVERIFY(sysmend::normalizeActiveState(QStringLiteral("active\n")) == std::string("active"));
    QVERIFY(sysmend::normalizeActiveState(QStringLiteral("activating")) == std::string("active"));
    QVERIFY(sysmend::normalizeActiveState(QStringLiteral("failed")) == std::string("inactive"));
    QVERIFY(sysmend::normalizeActiveState(QStringLiteral("inactive")) == std::string("inactive"));
    QVERIFY(!sysmend::normalizeActiveState(QStringLiteral("unknown")).has_value());
    QVERIFY(!sysmend::normalizeActiveState(QString()).has_value());

    QVERIFY(sysmend::normalizeEnabledState(QStringLiteral("enabled-runtime")) == std::string("enabled"));
    QVERIFY(sysmend::normalizeEnabledState(QStringLiteral("disabled")) == std::string("disabled"));
    QVERIFY(!sysmend::normalizeEnabledState(QStringLiteral("static")).has_value());
    QVERIFY(!sysmend::normalizeEnabledState(QStringLiteral("masked")).has_value());
}

void LinuxSourcesTests::testUfwPolicyOnlyReportsSettableValues()
{
    const QString status = QStringLiteral(
        "Status: active\n"
        "Logging: on (low)\n"
        "Default: deny (incoming), allow (outgoing), disabled (routed)\n"
        "New profiles: skip\n");

    QVERIFY(sysmend::ufwDefaultPolicy(status, QStringLiteral("incoming")) == std::string("deny"));
    QVERIFY(sysmend::ufwDefaultPolicy(status, QStringLiteral("outgoing")) == std::string("allow"));
    QVERIFY(!sysmend::ufwDefaultPolicy(status, QStringLiteral("routed")).has_value());
    QVERIFY(!sysmend::ufwDefaultPolicy(QStringLiteral("Status: inactive"),
                                       QStringLiteral("incoming")).has_value());
}

void LinuxSourcesTests::testGovernorReadRequiresAgreement()
{
    QVERIFY(sysmend::commonGovernor({QStringLiteral("performance"), QStringLiteral("performance")})
            == std::string("performance"));
    QVERIFY(!sysmend::commonGovernor({QStringLiteral("performance"), QStringLiteral("powersave")})
                 .has_value());
    QVERIFY(!sysmend::commonGovernor({}).has_value());
}

QTEST_MAIN(LinuxSourcesTests)
#include "test_linux_sources.moc"
