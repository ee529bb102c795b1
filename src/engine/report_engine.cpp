#include "engine/report_engine.hpp"

#include <utility>

#include "engine/filter_resolver.hpp"
#include "engine/legend_summarizer.hpp"
#include "engine/monthly_aggregator.hpp"

namespace timeledger {

ReportView computeReport(const WorkspaceSnapshot &snapshot, const FilterCriteria &criteria)
{
    ReportView view;
    ProjectScope scope = FilterResolver::resolve(snapshot.projects,
                                                 snapshot.clients,
                                                 criteria.client,
                                                 criteria.selectedProjectIds);

    view.year = MonthlyAggregator::aggregate(snapshot, criteria);
    view.chart = scaleChart(view.year.months);
    view.legend = summarizeLegend(
        MonthlyAggregator::filterYearEntries(snapshot.entries, criteria.year,
                                             scope.activeProjectIds,
                                             criteria.invoiceStatus),
        snapshot.projects);

    view.availableProjects = std::move(scope.availableProjects);
    view.activeProjectIds = std::move(scope.activeProjectIds);
    return view;
}

} // namespace timeledger
