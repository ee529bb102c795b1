#pragma once

#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace timeledger {

class MonthlyAggregator
{
public:
    static bool matchesInvoiceFilter(bool invoiced, InvoiceFilter filter);

    // Entries dated in year, on an active project, passing the invoice filter.
    // Input order is preserved.
    static std::vector<TimeEntry> filterYearEntries(const std::vector<TimeEntry> &entries,
                                                    int year,
                                                    const std::set<std::string> &activeProjectIds,
                                                    InvoiceFilter invoiceStatus);

    // Sum of prices of one cost category for a single month of year.
    static double costAmount(const std::vector<CostItem> &items,
                             int year,
                             int month,
                             const std::set<std::string> &activeProjectIds,
                             InvoiceFilter invoiceStatus);

    /**
     * Build the twelve monthly aggregates of criteria.year.
     *
     * The selected project ids are first reconciled against the projects
     * available under criteria.client (see FilterResolver::resolve), so ids
     * left over from another client filter, or of projects no longer in the
     * catalog, never reach the totals.
     */
    static YearReport aggregate(const WorkspaceSnapshot &snapshot, const FilterCriteria &criteria);

private:
    static YearReport aggregateScope(const WorkspaceSnapshot &snapshot,
                                     int year,
                                     const std::set<std::string> &activeProjectIds,
                                     InvoiceFilter invoiceStatus);
};

} // namespace timeledger
