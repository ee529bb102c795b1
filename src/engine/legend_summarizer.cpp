#include "engine/legend_summarizer.hpp"

#include <algorithm>
#include <unordered_map>

#include "engine/duration.hpp"

namespace timeledger {

std::vector<LegendItem> summarizeLegend(const std::vector<TimeEntry> &entries,
                                        const std::vector<Project> &projects)
{
    std::unordered_map<std::string, const Project *> catalog;
    for (const auto &project : projects) {
        catalog.emplace(project.id, &project);
    }

    std::vector<LegendItem> legend;
    std::unordered_map<std::string, size_t> slot;
    for (const auto &entry : entries) {
        auto found = slot.find(entry.projectId);
        if (found == slot.end()) {
            const auto project = catalog.find(entry.projectId);
            if (project == catalog.end()) {
                continue;
            }
            const Project &p = *project->second;
            legend.push_back({p.id, p.name, p.color, 0.0});
            found = slot.emplace(entry.projectId, legend.size() - 1).first;
        }
        legend[found->second].totalHours += durationHours(entry.startTime, entry.endTime);
    }

    std::stable_sort(legend.begin(), legend.end(), [](const LegendItem &a, const LegendItem &b) {
        return a.totalHours > b.totalHours;
    });
    return legend;
}

} // namespace timeledger
