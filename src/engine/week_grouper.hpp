#pragma once

#include <vector>

#include <QDate>

#include "common/models.hpp"

namespace timeledger {

// Monday of the week containing date.
QDate startOfWeek(const QDate &date);

/**
 * Group time entries into Monday-aligned weeks and calendar days for the
 * activity feed.
 *
 * Weeks come most recent first, days inside a week most recent first, and
 * entries sharing a day by start time descending. Only weeks and days that
 * contain entries are produced. Entries without a valid date are skipped.
 * The input is not modified.
 */
std::vector<WeekGroup> groupEntriesByWeek(const std::vector<TimeEntry> &entries);

} // namespace timeledger
