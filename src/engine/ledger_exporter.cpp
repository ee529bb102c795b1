#include "engine/ledger_exporter.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <unordered_map>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/duration.hpp"
#include "engine/filter_resolver.hpp"
#include "engine/monthly_aggregator.hpp"

namespace timeledger {

namespace {

const char *const kHeavyRule =
    "=================================================================";
const char *const kLightRule =
    "-----------------------------------------------------------------";
const char *const kNoClientLabel = "No Client / Internal";

std::string hoursText(double hours)
{
    return QString::number(hours, 'f', 2).toStdString();
}

std::string ledgerDate(const QDate &date)
{
    return date.toString(QStringLiteral("dd/MM/yyyy")).toStdString();
}

// client name -> project name -> entries, both levels in ascending key order.
using LedgerGroups = std::map<std::string, std::map<std::string, std::vector<const TimeEntry *>>>;

} // namespace

std::string renderLedger(const WorkspaceSnapshot &snapshot,
                         const FilterCriteria &criteria,
                         const QDateTime &generatedAt)
{
    const ProjectScope scope = FilterResolver::resolve(snapshot.projects,
                                                       snapshot.clients,
                                                       criteria.client,
                                                       criteria.selectedProjectIds);
    std::vector<TimeEntry> entries = MonthlyAggregator::filterYearEntries(
        snapshot.entries, criteria.year, scope.activeProjectIds, criteria.invoiceStatus);
    std::stable_sort(entries.begin(), entries.end(), [](const TimeEntry &a, const TimeEntry &b) {
        if (a.date != b.date) {
            return a.date < b.date;
        }
        return a.startTime < b.startTime;
    });

    std::unordered_map<std::string, const Project *> catalog;
    for (const auto &project : snapshot.projects) {
        catalog.emplace(project.id, &project);
    }

    // Reconciled ids are a subset of the catalog, so every entry has a project.
    LedgerGroups groups;
    for (const auto &entry : entries) {
        const Project &project = *catalog.at(entry.projectId);
        const std::string clientName = project.client.value_or(kNoClientLabel);
        groups[clientName][project.name].push_back(&entry);
    }

    const int malformed = countMalformedEntries(entries);
    if (malformed > 0) {
        TLOG_WARN(QStringLiteral("LedgerExporter"),
                  QStringLiteral("renderLedger"),
                  QStringLiteral("malformed_clock_value"),
                  QStringLiteral("data_integrity"),
                  QStringLiteral("treat_component_as_zero"),
                  timeledger::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"entries", malformed}, {"year", criteria.year}}));
    }

    std::ostringstream out;
    out << "REPORT EXPORT - " << criteria.year << "\n";
    out << "Client Filter: "
        << FilterResolver::clientFilterDisplayName(criteria.client, snapshot.clients) << "\n";
    out << "Billing Status: "
        << FilterResolver::invoiceFilterDisplayName(criteria.invoiceStatus) << "\n";
    out << "Generated: "
        << generatedAt.toString(QStringLiteral("dd/MM/yyyy HH:mm")).toStdString() << "\n";
    out << kHeavyRule << "\n\n";

    double grandTotal = 0.0;
    for (const auto &[clientName, projects] : groups) {
        out << "CLIENT: " << clientName << "\n";
        out << kLightRule << "\n";

        for (const auto &[projectName, projectEntries] : projects) {
            out << "  PROJECT: " << projectName << "\n";

            double projectTotal = 0.0;
            for (const TimeEntry *entry : projectEntries) {
                const double hours = durationHours(entry->startTime, entry->endTime);
                projectTotal += hours;

                out << "    " << ledgerDate(entry->date) << " | " << entry->startTime
                    << " - " << entry->endTime << " | " << hoursText(hours) << "h";
                if (!entry->description.empty()) {
                    out << " - " << entry->description;
                }
                if (entry->invoiced) {
                    out << " [INVOICED]";
                }
                out << "\n";
            }

            out << "    >>> TOTAL PROJECT: " << hoursText(projectTotal) << " hours\n\n";
            grandTotal += projectTotal;
        }
        out << "\n";
    }

    out << kHeavyRule << "\n";
    out << "GRAND TOTAL: " << hoursText(grandTotal) << " hours\n";

    TLOG_DEBUG(QStringLiteral("LedgerExporter"),
               QStringLiteral("renderLedger"),
               QStringLiteral("ledger_rendered"),
               QStringLiteral("user_export"),
               QStringLiteral("group_client_project"),
               timeledger::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"entries", entries.size()},
                               {"clients", groups.size()},
                               {"grandTotalHours", grandTotal}}));
    return out.str();
}

std::string suggestedLedgerFileName(const FilterCriteria &criteria)
{
    std::string clientPart = "All";
    if (criteria.client.scope == ClientScope::Unassigned) {
        clientPart = "no-client";
    } else if (criteria.client.scope == ClientScope::Client) {
        clientPart = criteria.client.clientId;
    }
    return "Report_" + std::to_string(criteria.year) + "_" + clientPart + "_"
        + toInvoiceFilterString(criteria.invoiceStatus) + ".txt";
}

} // namespace timeledger
