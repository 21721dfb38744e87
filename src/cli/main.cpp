#include <csignal>
#include <vector>

#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "cli/SysmendCli.hpp"
#include "common/logging.hpp"

namespace {

sysmend::CancellationToken *g_cancel = nullptr;

void handleInterrupt(int)
{
    if (g_cancel) {
        g_cancel->cancel();
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sysmend"));

    bool trace = qEnvironmentVariableIntValue("SYSMEND_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    sysmend::logging::initLogging(QStringLiteral("sysmend"), trace);
    SMLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               sysmend::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    sysmend::SysmendCli cli;
    g_cancel = &cli.cancellationToken();
    std::signal(SIGINT, handleInterrupt);

    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    const int code = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
    g_cancel = nullptr;
    return code;
}
