#include "report/ReportCli.hpp"

#include <algorithm>
#include <iostream>

#include <QDate>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLocale>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/currency_formatter.hpp"
#include "engine/duration.hpp"
#include "engine/filter_resolver.hpp"
#include "engine/ledger_exporter.hpp"
#include "engine/report_engine.hpp"
#include "engine/week_grouper.hpp"
#include "engine/workspace_loader.hpp"

namespace timeledger {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  timeledger-report feed --input SNAPSHOT [--format markdown|json]\n"
        "  timeledger-report summary --input SNAPSHOT [--year YYYY] [--client all|none|ID]\n"
        "                    [--projects ID,ID] [--invoice all|invoiced|not-invoiced]\n"
        "                    [--format markdown|json]\n"
        "  timeledger-report export --input SNAPSHOT [--year YYYY] [--client all|none|ID]\n"
        "                    [--projects ID,ID] [--invoice all|invoiced|not-invoiced]\n"
        "                    [--out FILE|DIR]\n");
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

bool isKnownFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

std::string projectName(const WorkspaceSnapshot &snapshot, const std::string &id)
{
    const auto it = std::find_if(snapshot.projects.begin(), snapshot.projects.end(),
                                 [&id](const Project &project) { return project.id == id; });
    return it == snapshot.projects.end() ? std::string("(unknown project)") : it->name;
}

std::string monthTitle(int month, int year)
{
    return QLocale::c().monthName(month).toStdString() + " " + std::to_string(year);
}

std::string hoursText(double hours, int precision)
{
    return QString::number(hours, 'f', precision).toStdString();
}

void renderFeedMarkdown(const std::vector<WeekGroup> &weeks, const WorkspaceSnapshot &snapshot)
{
    std::cout << "# Activity Feed\n\n";
    if (weeks.empty()) {
        std::cout << "No time entries.\n";
        return;
    }

    for (const auto &week : weeks) {
        std::cout << "## Week " << toIsoDate(week.start) << " - " << toIsoDate(week.end)
                  << " (total " << formatClock(week.totalMinutes) << ")\n\n";
        for (const auto &day : week.days) {
            std::cout << "### "
                      << day.date.toString(QStringLiteral("ddd yyyy-MM-dd")).toStdString()
                      << " (total " << formatClock(day.totalMinutes) << ")\n\n";
            for (const auto &entry : day.entries) {
                std::cout << "- " << entry.startTime << " - " << entry.endTime << " ("
                          << formatClock(durationMinutes(entry.startTime, entry.endTime))
                          << ") " << projectName(snapshot, entry.projectId);
                if (!entry.description.empty()) {
                    std::cout << ": " << entry.description;
                }
                if (entry.invoiced) {
                    std::cout << " [invoiced]";
                } else if (!entry.billable) {
                    std::cout << " [non-billable]";
                }
                std::cout << "\n";
            }
            std::cout << "\n";
        }
    }
}

nlohmann::json chartToJson(const ChartSeries &chart)
{
    nlohmann::json bars = nlohmann::json::array();
    for (const auto &bar : chart.bars) {
        nlohmann::json segments = nlohmann::json::array();
        for (const auto &segment : bar.segments) {
            segments.push_back({{"projectId", segment.projectId},
                                {"name", segment.name},
                                {"color", segment.color},
                                {"hours", segment.hours},
                                {"fraction", segment.fraction}});
        }
        bars.push_back({{"month", bar.month},
                        {"totalHours", bar.totalHours},
                        {"segments", segments}});
    }
    return nlohmann::json{{"scaleHours", chart.scaleHours}, {"bars", bars}};
}

void renderSummaryJson(const ReportView &view,
                       const WorkspaceSnapshot &snapshot,
                       const FilterCriteria &criteria)
{
    const YearReport &year = view.year;
    nlohmann::json payload;
    payload["clientFilter"] =
        FilterResolver::clientFilterDisplayName(criteria.client, snapshot.clients);
    payload["invoiceStatus"] = toInvoiceFilterString(criteria.invoiceStatus);
    payload["availableProjects"] = view.availableProjects;
    payload["activeProjectIds"] = view.activeProjectIds;
    payload["report"] = year;
    payload["chart"] = chartToJson(view.chart);
    payload["legend"] = view.legend;
    payload["formatted"] = {
        {"hoursAmount", formatCurrency(year.hoursAmountTotal, snapshot.settings)},
        {"licenseAmount", formatCurrency(year.licenseAmountTotal, snapshot.settings)},
        {"serverAmount", formatCurrency(year.serverAmountTotal, snapshot.settings)},
        {"domainAmount", formatCurrency(year.domainAmountTotal, snapshot.settings)},
        {"grandTotalAmount", formatCurrency(year.grandTotalAmount, snapshot.settings)}
    };

    std::cout << payload.dump(2) << std::endl;
}

void renderSummaryMarkdown(const ReportView &view,
                           const WorkspaceSnapshot &snapshot,
                           const FilterCriteria &criteria)
{
    const YearReport &year = view.year;
    const WorkspaceSettings &settings = snapshot.settings;

    std::cout << "# Report " << year.year << "\n\n";
    std::cout << "Client Filter: "
              << FilterResolver::clientFilterDisplayName(criteria.client, snapshot.clients)
              << "\n";
    std::cout << "Billing Status: "
              << FilterResolver::invoiceFilterDisplayName(criteria.invoiceStatus) << "\n";
    std::cout << "Showing data for " << view.activeProjectIds.size() << " of "
              << view.availableProjects.size() << " projects\n\n";

    std::cout << "## Totals\n\n";
    std::cout << "- Hours: " << hoursText(year.grandTotalHours, 1) << " ("
              << formatHoursClock(year.grandTotalHours) << ")\n";
    std::cout << "- Time: " << formatCurrency(year.hoursAmountTotal, settings) << "\n";
    std::cout << "- Licenses: " << formatCurrency(year.licenseAmountTotal, settings) << "\n";
    std::cout << "- Servers: " << formatCurrency(year.serverAmountTotal, settings) << "\n";
    std::cout << "- Domains: " << formatCurrency(year.domainAmountTotal, settings) << "\n";
    std::cout << "- Total: " << formatCurrency(year.grandTotalAmount, settings) << "\n\n";

    std::cout << "## Months\n\n";
    std::cout << "| Month | Hours | Total Amount | Entries |\n";
    std::cout << "|---|---|---|---|\n";
    for (const auto &month : year.months) {
        std::cout << "| " << monthTitle(month.month, year.year) << " | "
                  << formatHoursClock(month.totalHours) << " ("
                  << hoursText(month.totalHours, 1) << "h) | "
                  << formatCurrency(month.totalAmount, settings) << " | "
                  << month.entryCount << " |\n";
    }

    std::cout << "\n## Monthly Activity\n\n";
    for (const auto &bar : view.chart.bars) {
        std::cout << "- " << QLocale::c().monthName(bar.month, QLocale::ShortFormat).toStdString()
                  << ": " << hoursText(bar.totalHours, 1) << "h";
        for (const auto &segment : bar.segments) {
            std::cout << " | " << segment.name << " " << hoursText(segment.hours, 2) << "h ("
                      << hoursText(segment.fraction * 100.0, 0) << "%)";
        }
        std::cout << "\n";
    }

    std::cout << "\n## Projects\n\n";
    if (view.legend.empty()) {
        std::cout << "No data.\n";
        return;
    }
    for (const auto &item : view.legend) {
        std::cout << "- " << item.name << " (" << hoursText(item.totalHours, 1) << "h)\n";
    }
}

} // namespace

int ReportCli::run(int argc, char *argv[])
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

    // Every event of one invocation shares a correlation id.
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    timeledger::logging::CorrelationScope corrScope(corrId);

    const QString command = args.at(1);
    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("run"),
              QStringLiteral("report_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              timeledger::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()},
                              {"trace", timeledger::logging::isTraceEnabled()}}));
    if (command == QStringLiteral("feed")) {
        return runFeedReport(args);
    }
    if (command == QStringLiteral("summary")) {
        return runSummaryReport(args);
    }
    if (command == QStringLiteral("export")) {
        return runExportReport(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runFeedReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isKnownFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const auto snapshot = loadInput(args);
    if (!snapshot.has_value()) {
        return 1;
    }

    const std::vector<WeekGroup> weeks = groupEntriesByWeek(snapshot->entries);
    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["weeks"] = weeks;
        std::cout << payload.dump(2) << std::endl;
    } else {
        renderFeedMarkdown(weeks, *snapshot);
    }

    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runFeedReport"),
              QStringLiteral("report_feed"),
              QStringLiteral("user_invocation"),
              QStringLiteral("week_grouping"),
              timeledger::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"weeks", weeks.size()},
                              {"format", format.toStdString()}}));
    return 0;
}

int ReportCli::runSummaryReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isKnownFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const auto snapshot = loadInput(args);
    if (!snapshot.has_value()) {
        return 1;
    }
    const auto criteria = parseCriteria(args, *snapshot);
    if (!criteria.has_value()) {
        return 1;
    }

    const ReportView view = computeReport(*snapshot, *criteria);
    if (format == QStringLiteral("json")) {
        renderSummaryJson(view, *snapshot, *criteria);
    } else {
        renderSummaryMarkdown(view, *snapshot, *criteria);
    }

    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runSummaryReport"),
              QStringLiteral("report_summary"),
              QStringLiteral("user_invocation"),
              QStringLiteral("monthly_aggregation"),
              timeledger::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"year", criteria->year},
                              {"activeProjects", view.activeProjectIds.size()},
                              {"format", format.toStdString()}}));
    return 0;
}

int ReportCli::runExportReport(const QStringList &args)
{
    const auto snapshot = loadInput(args);
    if (!snapshot.has_value()) {
        return 1;
    }
    const auto criteria = parseCriteria(args, *snapshot);
    if (!criteria.has_value()) {
        return 1;
    }

    const QDateTime generatedAt =
        m_generatedAt.isValid() ? m_generatedAt : QDateTime::currentDateTime();
    const std::string ledger = renderLedger(*snapshot, *criteria, generatedAt);

    QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (outPath.isEmpty()) {
        std::cout << ledger;
        return 0;
    }
    if (QFileInfo(outPath).isDir()) {
        outPath = QDir(outPath).filePath(
            QString::fromStdString(suggestedLedgerFileName(*criteria)));
    }

    QFile outFile(outPath);
    if (!outFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        std::cerr << "Failed to write ledger." << std::endl;
        return 1;
    }
    const QByteArray data = QByteArray::fromStdString(ledger);
    if (outFile.write(data) != data.size()) {
        std::cerr << "Failed to write ledger." << std::endl;
        return 1;
    }

    TLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runExportReport"),
              QStringLiteral("report_export"),
              QStringLiteral("user_invocation"),
              QStringLiteral("ledger_file"),
              timeledger::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"year", criteria->year},
                              {"out", outPath.toStdString()}}));
    return 0;
}

std::optional<WorkspaceSnapshot> ReportCli::loadInput(const QStringList &args) const
{
    const QString inputPath = getArgValue(args, QStringLiteral("--input"));
    if (inputPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return std::nullopt;
    }
    if (!QFile::exists(inputPath)) {
        std::cerr << "Input path does not exist." << std::endl;
        return std::nullopt;
    }

    auto snapshot = loadWorkspaceSnapshot(inputPath.toStdString());
    if (!snapshot.has_value()) {
        std::cerr << "Failed to read workspace snapshot." << std::endl;
    }
    return snapshot;
}

std::optional<FilterCriteria> ReportCli::parseCriteria(const QStringList &args,
                                                       const WorkspaceSnapshot &snapshot) const
{
    FilterCriteria criteria;

    const QString yearValue = getArgValue(args, QStringLiteral("--year"));
    if (yearValue.isEmpty()) {
        criteria.year = QDate::currentDate().year();
    } else {
        bool ok = false;
        criteria.year = yearValue.toInt(&ok);
        if (!ok) {
            std::cerr << "Invalid year." << std::endl;
            return std::nullopt;
        }
    }

    const QString clientValue = getArgValue(args, QStringLiteral("--client"));
    if (clientValue.isEmpty() || clientValue == QStringLiteral("all")) {
        criteria.client = ClientSelector::all();
    } else if (clientValue == QStringLiteral("none")) {
        criteria.client = ClientSelector::unassigned();
    } else {
        criteria.client = ClientSelector::client(clientValue.toStdString());
    }

    const QString invoiceValue = getArgValue(args, QStringLiteral("--invoice"));
    if (!invoiceValue.isEmpty()) {
        const auto filter = parseInvoiceFilterString(invoiceValue.toLower().toStdString());
        if (!filter.has_value()) {
            std::cerr << "Invalid invoice filter. Use all, invoiced or not-invoiced."
                      << std::endl;
            return std::nullopt;
        }
        criteria.invoiceStatus = *filter;
    }

    // Without an explicit list every project available to the client filter is selected.
    const QString projectsValue = getArgValue(args, QStringLiteral("--projects"));
    if (projectsValue.isEmpty()) {
        criteria.selectedProjectIds = FilterResolver::defaultSelection(
            FilterResolver::availableProjects(snapshot.projects, snapshot.clients,
                                              criteria.client));
    } else {
        const QStringList ids = projectsValue.split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (const QString &id : ids) {
            criteria.selectedProjectIds.insert(id.trimmed().toStdString());
        }
    }
    return criteria;
}

} // namespace timeledger
