#pragma once

#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/chart_scaler.hpp"

namespace timeledger {

struct ReportView {
    std::vector<Project> availableProjects;
    std::set<std::string> activeProjectIds;
    YearReport year;
    ChartSeries chart;
    std::vector<LegendItem> legend;
};

// Full recomputation of the reports screen for one snapshot and filter state.
ReportView computeReport(const WorkspaceSnapshot &snapshot, const FilterCriteria &criteria);

} // namespace timeledger
