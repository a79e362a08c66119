#include "calendar.hpp"
#include "errors.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace importcalc {

// ============================================================================
// CalendarDate Implementation
// ============================================================================

CalendarDate::CalendarDate()
    : year(1970), month(1), day(1) {
}

CalendarDate::CalendarDate(int y, int m, int d)
    : year(y), month(m), day(d) {
    if (m < 1 || m > 12) {
        throw InvalidInput("Month " + std::to_string(m) + " must be between 1 and 12");
    }
    if (d < 1 || d > days_in_month(y, m)) {
        throw InvalidInput("Day " + std::to_string(d) + " is not valid for " +
                           std::to_string(y) + "-" + std::to_string(m));
    }
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool CalendarDate::operator!=(const CalendarDate& other) const {
    return !(*this == other);
}

bool CalendarDate::operator<(const CalendarDate& other) const {
    return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
}

bool CalendarDate::operator<=(const CalendarDate& other) const {
    return !(other < *this);
}

std::string CalendarDate::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << month << "-" << std::setw(2) << day;
    return oss.str();
}

CalendarDate CalendarDate::parse(const std::string& text) {
    int y = 0;
    int m = 0;
    int d = 1;
    char sep1 = 0;
    char sep2 = 0;

    std::istringstream iss(text);
    iss >> y >> sep1 >> m;
    if (iss.fail() || sep1 != '-') {
        throw InvalidInput("Invalid date '" + text + "', expected YYYY-MM-DD");
    }
    if (iss >> sep2) {
        if (sep2 != '-' || !(iss >> d)) {
            throw InvalidInput("Invalid date '" + text + "', expected YYYY-MM-DD");
        }
        // Allow an ISO time suffix ("2021-03-15T00:00:00Z"); anything else is an error
        char rest = 0;
        if (iss >> rest && rest != 'T') {
            throw InvalidInput("Invalid date '" + text + "', expected YYYY-MM-DD");
        }
    }

    return CalendarDate(y, m, d);
}

int days_in_month(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return DAYS[month - 1];
}

int months_between(const CalendarDate& registration, const CalendarDate& evaluation) {
    if (evaluation < registration) {
        throw InvalidInput("Evaluation date " + evaluation.to_string() +
                           " precedes first registration " + registration.to_string());
    }
    return (evaluation.year - registration.year) * 12 + (evaluation.month - registration.month);
}

// ============================================================================
// Clocks
// ============================================================================

CalendarDate SystemClock::today() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    return CalendarDate(tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday);
}

const Clock& system_clock() {
    static const SystemClock instance{};
    return instance;
}

} // namespace importcalc
