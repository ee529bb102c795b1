#include <QCoreApplication>

#include "report/ReportCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

#include <vector>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("timeledger-report"));

    bool trace = qEnvironmentVariableIntValue("TIMELEDGER_TRACE") == 1;
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
    timeledger::logging::initLogging(QStringLiteral("timeledger-report"), trace);
    TLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("report_cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              timeledger::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", filteredArgs.size()}, {"trace", trace}}));

    timeledger::ReportCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
