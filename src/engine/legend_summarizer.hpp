#pragma once

#include <vector>

#include "common/models.hpp"

namespace timeledger {

// One item per catalogued project found in entries, by total hours
// descending. Ties keep the order in which projects were first seen.
std::vector<LegendItem> summarizeLegend(const std::vector<TimeEntry> &entries,
                                        const std::vector<Project> &projects);

} // namespace timeledger
