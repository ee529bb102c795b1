#include "engine/monthly_aggregator.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/duration.hpp"
#include "engine/filter_resolver.hpp"

namespace timeledger {

namespace {

constexpr int kMonthsPerYear = 12;

// Active project ids are reconciled against the catalog, so every aggregated
// entry has an index slot.
using ProjectIndex = std::unordered_map<std::string, const Project *>;

ProjectIndex indexProjects(const std::vector<Project> &projects)
{
    ProjectIndex index;
    for (const auto &project : projects) {
        index.emplace(project.id, &project);
    }
    return index;
}

std::vector<ProjectHours> breakdownByProject(const std::vector<const TimeEntry *> &entries,
                                             const ProjectIndex &projects)
{
    std::vector<ProjectHours> breakdown;
    for (const TimeEntry *entry : entries) {
        const Project *project = projects.at(entry->projectId);
        auto it = std::find_if(breakdown.begin(), breakdown.end(),
                               [entry](const ProjectHours &item) {
                                   return item.projectId == entry->projectId;
                               });
        if (it == breakdown.end()) {
            breakdown.push_back({project->id, project->name, project->color, 0.0});
            it = breakdown.end() - 1;
        }
        it->hours += durationHours(entry->startTime, entry->endTime);
    }
    std::stable_sort(breakdown.begin(), breakdown.end(),
                     [](const ProjectHours &a, const ProjectHours &b) {
                         return a.hours > b.hours;
                     });
    return breakdown;
}

} // namespace

bool MonthlyAggregator::matchesInvoiceFilter(bool invoiced, InvoiceFilter filter)
{
    switch (filter) {
    case InvoiceFilter::All:
        return true;
    case InvoiceFilter::Invoiced:
        return invoiced;
    case InvoiceFilter::NotInvoiced:
        return !invoiced;
    }
    return true;
}

std::vector<TimeEntry> MonthlyAggregator::filterYearEntries(
    const std::vector<TimeEntry> &entries,
    int year,
    const std::set<std::string> &activeProjectIds,
    InvoiceFilter invoiceStatus)
{
    std::vector<TimeEntry> result;
    for (const auto &entry : entries) {
        if (entry.date.isValid() && entry.date.year() == year
            && activeProjectIds.count(entry.projectId) > 0
            && matchesInvoiceFilter(entry.invoiced, invoiceStatus)) {
            result.push_back(entry);
        }
    }
    return result;
}

double MonthlyAggregator::costAmount(const std::vector<CostItem> &items,
                                     int year,
                                     int month,
                                     const std::set<std::string> &activeProjectIds,
                                     InvoiceFilter invoiceStatus)
{
    double amount = 0.0;
    for (const auto &item : items) {
        if (item.date.isValid() && item.date.year() == year && item.date.month() == month
            && activeProjectIds.count(item.projectId) > 0
            && matchesInvoiceFilter(item.invoiced, invoiceStatus)) {
            amount += std::max(0.0, item.price);
        }
    }
    return amount;
}

YearReport MonthlyAggregator::aggregateScope(const WorkspaceSnapshot &snapshot,
                                             int year,
                                             const std::set<std::string> &activeProjectIds,
                                             InvoiceFilter invoiceStatus)
{
    TLOG_DEBUG(QStringLiteral("MonthlyAggregator"),
               QStringLiteral("aggregate"),
               QStringLiteral("aggregate_year_start"),
               QStringLiteral("report_refresh"),
               QStringLiteral("full_recompute"),
               timeledger::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"year", year},
                               {"activeProjects", activeProjectIds.size()},
                               {"invoiceStatus", toInvoiceFilterString(invoiceStatus)}}));

    const ProjectIndex projects = indexProjects(snapshot.projects);
    const std::vector<TimeEntry> yearEntries =
        filterYearEntries(snapshot.entries, year, activeProjectIds, invoiceStatus);

    const int malformed = countMalformedEntries(yearEntries);
    if (malformed > 0) {
        TLOG_WARN(QStringLiteral("MonthlyAggregator"),
                  QStringLiteral("aggregate"),
                  QStringLiteral("malformed_clock_value"),
                  QStringLiteral("data_integrity"),
                  QStringLiteral("treat_component_as_zero"),
                  timeledger::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"year", year}, {"entries", malformed}}));
    }

    std::array<std::vector<const TimeEntry *>, kMonthsPerYear> byMonth;
    for (const auto &entry : yearEntries) {
        byMonth[entry.date.month() - 1].push_back(&entry);
    }

    YearReport report;
    report.year = year;
    report.months.reserve(kMonthsPerYear);

    for (int month = 1; month <= kMonthsPerYear; ++month) {
        const auto &monthEntries = byMonth[month - 1];

        MonthlyAggregate aggregate;
        aggregate.month = month;
        aggregate.entryCount = static_cast<int>(monthEntries.size());

        for (const TimeEntry *entry : monthEntries) {
            const double hours = durationHours(entry->startTime, entry->endTime);
            aggregate.totalHours += hours;
            if (!entry->billable) {
                continue;
            }
            const Project *project = projects.at(entry->projectId);
            if (project->rate.has_value()) {
                aggregate.hoursAmount += hours * std::max(0.0, *project->rate);
            }
        }

        const auto categoryAmount = [&](CostCategory category) {
            return costAmount(snapshot.costItems(category), year, month,
                              activeProjectIds, invoiceStatus);
        };
        aggregate.licenseAmount = categoryAmount(CostCategory::License);
        aggregate.serverAmount = categoryAmount(CostCategory::Server);
        aggregate.domainAmount = categoryAmount(CostCategory::Domain);
        aggregate.totalAmount = aggregate.hoursAmount + aggregate.licenseAmount
            + aggregate.serverAmount + aggregate.domainAmount;
        aggregate.projectBreakdown = breakdownByProject(monthEntries, projects);

        report.grandTotalHours += aggregate.totalHours;
        report.grandTotalAmount += aggregate.totalAmount;
        report.hoursAmountTotal += aggregate.hoursAmount;
        report.licenseAmountTotal += aggregate.licenseAmount;
        report.serverAmountTotal += aggregate.serverAmount;
        report.domainAmountTotal += aggregate.domainAmount;
        report.months.push_back(std::move(aggregate));
    }

    TLOG_DEBUG(QStringLiteral("MonthlyAggregator"),
               QStringLiteral("aggregate"),
               QStringLiteral("aggregate_year_complete"),
               QStringLiteral("report_refresh"),
               QStringLiteral("full_recompute"),
               timeledger::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"year", year},
                               {"entries", yearEntries.size()},
                               {"grandTotalHours", report.grandTotalHours},
                               {"grandTotalAmount", report.grandTotalAmount},
                               {toCategoryString(CostCategory::License), report.licenseAmountTotal},
                               {toCategoryString(CostCategory::Server), report.serverAmountTotal},
                               {toCategoryString(CostCategory::Domain), report.domainAmountTotal}}));
    return report;
}

YearReport MonthlyAggregator::aggregate(const WorkspaceSnapshot &snapshot,
                                        const FilterCriteria &criteria)
{
    const ProjectScope scope = FilterResolver::resolve(snapshot.projects,
                                                       snapshot.clients,
                                                       criteria.client,
                                                       criteria.selectedProjectIds);
    return aggregateScope(snapshot, criteria.year, scope.activeProjectIds, criteria.invoiceStatus);
}

} // namespace timeledger
