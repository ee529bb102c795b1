#include "engine/duration.hpp"

#include <algorithm>
#include <cmath>

#include <QString>
#include <QStringList>

namespace timeledger {

namespace {

constexpr int kMinutesPerDay = 24 * 60;

// Returns -1 when the component is missing, not a number or above limit.
int parseComponent(const QStringList &parts, int index, int limit)
{
    if (index >= parts.size()) {
        return -1;
    }
    bool ok = false;
    const int value = parts.at(index).trimmed().toInt(&ok);
    if (!ok || value < 0 || value > limit) {
        return -1;
    }
    return value;
}

struct ClockValue {
    int hours = 0;
    int minutes = 0;
    bool malformed = false;
};

ClockValue parseClock(const std::string &clock)
{
    const QStringList parts = QString::fromStdString(clock).split(QLatin1Char(':'));
    const int hours = parseComponent(parts, 0, 23);
    const int minutes = parseComponent(parts, 1, 59);

    ClockValue value;
    value.malformed = hours < 0 || minutes < 0;
    value.hours = std::max(0, hours);
    value.minutes = std::max(0, minutes);
    return value;
}

QString twoDigits(int value)
{
    return QStringLiteral("%1").arg(value, 2, 10, QLatin1Char('0'));
}

} // namespace

bool isWellFormedClock(const std::string &clock)
{
    return !parseClock(clock).malformed;
}

int durationMinutes(const std::string &start, const std::string &end)
{
    const ClockValue from = parseClock(start);
    const ClockValue to = parseClock(end);
    int minutes = (to.hours * 60 + to.minutes) - (from.hours * 60 + from.minutes);
    if (minutes < 0) {
        minutes += kMinutesPerDay;
    }
    return std::max(0, minutes);
}

double durationHours(const std::string &start, const std::string &end)
{
    return durationMinutes(start, end) / 60.0;
}

int countMalformedEntries(const std::vector<TimeEntry> &entries)
{
    return static_cast<int>(std::count_if(entries.begin(), entries.end(),
                                          [](const TimeEntry &entry) {
                                              return !isWellFormedClock(entry.startTime)
                                                  || !isWellFormedClock(entry.endTime);
                                          }));
}

std::string formatClock(int minutes)
{
    const int total = std::max(0, minutes);
    return (twoDigits(total / 60) + QLatin1Char(':') + twoDigits(total % 60)
            + QStringLiteral(":00"))
        .toStdString();
}

std::string formatHoursClock(double hours)
{
    if (!std::isfinite(hours) || hours < 0.0) {
        hours = 0.0;
    }
    int whole = static_cast<int>(std::floor(hours));
    int minutes = static_cast<int>(std::lround((hours - whole) * 60.0));
    if (minutes == 60) {
        ++whole;
        minutes = 0;
    }
    return (twoDigits(whole) + QLatin1Char(':') + twoDigits(minutes)
            + QStringLiteral(":00"))
        .toStdString();
}

} // namespace timeledger
