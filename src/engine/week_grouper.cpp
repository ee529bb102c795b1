#include "engine/week_grouper.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/duration.hpp"

namespace timeledger {

QDate startOfWeek(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    // QDate::dayOfWeek(): Monday == 1 ... Sunday == 7.
    return date.addDays(1 - date.dayOfWeek());
}

std::vector<WeekGroup> groupEntriesByWeek(const std::vector<TimeEntry> &entries)
{
    std::vector<const TimeEntry *> sorted;
    sorted.reserve(entries.size());
    int skipped = 0;
    for (const auto &entry : entries) {
        if (!entry.date.isValid()) {
            ++skipped;
            continue;
        }
        sorted.push_back(&entry);
    }

    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TimeEntry *a, const TimeEntry *b) {
                         if (a->date != b->date) {
                             return a->date > b->date;
                         }
                         return a->startTime > b->startTime;
                     });

    std::vector<WeekGroup> weeks;
    for (const TimeEntry *entry : sorted) {
        const QDate weekStart = startOfWeek(entry->date);

        // Descending input means a new week or day can only ever follow the
        // last one created.
        if (weeks.empty() || weeks.back().start != weekStart) {
            WeekGroup week;
            week.start = weekStart;
            week.end = weekStart.addDays(6);
            weeks.push_back(std::move(week));
        }
        WeekGroup &week = weeks.back();

        if (week.days.empty() || week.days.back().date != entry->date) {
            DayGroup day;
            day.date = entry->date;
            week.days.push_back(std::move(day));
        }
        DayGroup &day = week.days.back();

        const int minutes = durationMinutes(entry->startTime, entry->endTime);
        day.entries.push_back(*entry);
        day.totalMinutes += minutes;
        week.totalMinutes += minutes;
    }

    if (skipped > 0) {
        TLOG_WARN(QStringLiteral("WeekGrouper"),
                  QStringLiteral("groupEntriesByWeek"),
                  QStringLiteral("entries_without_date"),
                  QStringLiteral("data_integrity"),
                  QStringLiteral("skip_entry"),
                  timeledger::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"skipped", skipped}}));
    }
    const int malformed = countMalformedEntries(entries);
    if (malformed > 0) {
        TLOG_WARN(QStringLiteral("WeekGrouper"),
                  QStringLiteral("groupEntriesByWeek"),
                  QStringLiteral("malformed_clock_value"),
                  QStringLiteral("data_integrity"),
                  QStringLiteral("treat_component_as_zero"),
                  timeledger::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"entries", malformed}}));
    }
    TLOG_DEBUG(QStringLiteral("WeekGrouper"),
               QStringLiteral("groupEntriesByWeek"),
               QStringLiteral("group_entries_complete"),
               QStringLiteral("feed_refresh"),
               QStringLiteral("sort_then_bucket"),
               timeledger::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"entries", entries.size()},
                               {"weeks", weeks.size()}}));
    return weeks;
}

} // namespace timeledger
