#ifndef IMPORTCALC_CALENDAR_HPP
#define IMPORTCALC_CALENDAR_HPP

#include <memory>
#include <string>

namespace importcalc {

// Civil calendar date (proleptic Gregorian), no time of day
struct CalendarDate {
    int year;
    int month;   // 1-12
    int day;     // 1-31

    CalendarDate();
    CalendarDate(int y, int m, int d);

    bool operator==(const CalendarDate& other) const;
    bool operator!=(const CalendarDate& other) const;
    bool operator<(const CalendarDate& other) const;
    bool operator<=(const CalendarDate& other) const;

    // ISO 8601 "YYYY-MM-DD"
    std::string to_string() const;

    // Parses "YYYY-MM-DD" or "YYYY-MM" (day defaults to 1).
    // Throws InvalidInput on malformed text or impossible dates.
    static CalendarDate parse(const std::string& text);
};

int days_in_month(int year, int month);

// Vehicle age in whole months: 12 * (year diff) + (month diff).
// Day of month is ignored, so 2024-01-31 -> 2024-02-01 counts as one month.
// Throws InvalidInput if evaluation precedes registration.
int months_between(const CalendarDate& registration, const CalendarDate& evaluation);

/**
 * @brief Source of "today" for calculations without an explicit evaluation date
 *
 * Injected into the engines so results are reproducible under test.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual CalendarDate today() const = 0;
};

// Local-time wall clock
class SystemClock : public Clock {
public:
    CalendarDate today() const override;
};

// Always returns the same date
class FixedClock : public Clock {
public:
    explicit FixedClock(const CalendarDate& date) : date_(date) {}
    CalendarDate today() const override { return date_; }

private:
    CalendarDate date_;
};

// Process-wide SystemClock instance
const Clock& system_clock();

} // namespace importcalc

#endif // IMPORTCALC_CALENDAR_HPP
