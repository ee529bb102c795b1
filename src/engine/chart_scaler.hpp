#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace timeledger {

struct ChartSegment {
    std::string projectId;
    std::string name;
    std::string color;
    double hours = 0.0;
    // hours / ChartSeries::scaleHours, always within [0, 1].
    double fraction = 0.0;
};

struct ChartBar {
    int month = 0;
    double totalHours = 0.0;
    std::vector<ChartSegment> segments;
};

struct ChartSeries {
    // The busiest month's hours, never below one hour.
    double scaleHours = 1.0;
    std::vector<ChartBar> bars;
};

// Every bar is scaled against the same year-wide maximum so bar heights are
// comparable between months.
ChartSeries scaleChart(const std::vector<MonthlyAggregate> &months);

} // namespace timeledger
