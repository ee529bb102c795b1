#include "engine/chart_scaler.hpp"

#include <algorithm>
#include <cmath>

namespace timeledger {

ChartSeries scaleChart(const std::vector<MonthlyAggregate> &months)
{
    ChartSeries series;
    for (const auto &month : months) {
        if (std::isfinite(month.totalHours)) {
            series.scaleHours = std::max(series.scaleHours, month.totalHours);
        }
    }

    series.bars.reserve(months.size());
    for (const auto &month : months) {
        ChartBar bar;
        bar.month = month.month;
        bar.totalHours = month.totalHours;
        for (const auto &item : month.projectBreakdown) {
            ChartSegment segment;
            segment.projectId = item.projectId;
            segment.name = item.name;
            segment.color = item.color;
            segment.hours = item.hours;
            segment.fraction = std::clamp(item.hours / series.scaleHours, 0.0, 1.0);
            bar.segments.push_back(std::move(segment));
        }
        series.bars.push_back(std::move(bar));
    }
    return series;
}

} // namespace timeledger
