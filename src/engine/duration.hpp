#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace timeledger {

// Elapsed minutes between two "HH:MM" wall-clock values. An end earlier than
// the start is an overnight shift and wraps by one day. A missing,
// non-numeric or out-of-range hour or minute counts as zero, so the result
// is always within [0, 1439].
int durationMinutes(const std::string &start, const std::string &end);

double durationHours(const std::string &start, const std::string &end);

// True when both components parse and hour <= 23, minute <= 59.
bool isWellFormedClock(const std::string &clock);

// Entries whose start or end would be read with zeroed components. Callers
// log this once per computation; the duration functions never log.
int countMalformedEntries(const std::vector<TimeEntry> &entries);

// "HH:MM:00"; hours are not wrapped at 24.
std::string formatClock(int minutes);
std::string formatHoursClock(double hours);

} // namespace timeledger
