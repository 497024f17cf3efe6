/**
 * @file Calendar.cpp
 * @brief Implementation of the calendar value objects.
 */

#include "domain/Calendar.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace schedsync::domain {

namespace {

const std::array<const char*, 7> kDayNames = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
};

bool IsLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeap(year)) return 29;
    return days[month - 1];
}

bool ReadInt(const std::string& text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

std::string WeekdayToString(Weekday day) {
    return kDayNames[static_cast<size_t>(day)];
}

std::optional<Weekday> WeekdayFromString(const std::string& text) {
    std::string lower;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (!std::isspace(c)) lower.push_back(static_cast<char>(std::tolower(c)));
    }
    if (lower.size() < 3) return std::nullopt;

    for (size_t i = 0; i < kDayNames.size(); ++i) {
        std::string name = kDayNames[i];
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == name || lower == name.substr(0, 3)) {
            return static_cast<Weekday>(i);
        }
    }
    return std::nullopt;
}

// Howard Hinnant's days_from_civil / civil_from_days.
long LocalDate::daysSinceEpoch() const {
    const int y = year - (month <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = static_cast<unsigned>(month + (month > 2 ? -3 : 9));
    const unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(day) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

LocalDate LocalDate::FromDays(long days) {
    days += 719468;
    const long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long y = static_cast<long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;

    LocalDate date;
    date.year = static_cast<int>(y + (m <= 2 ? 1 : 0));
    date.month = static_cast<int>(m);
    date.day = static_cast<int>(d);
    return date;
}

Weekday LocalDate::weekday() const {
    // 1970-01-01 was a Thursday (index 3).
    long idx = (daysSinceEpoch() + 3) % 7;
    if (idx < 0) idx += 7;
    return static_cast<Weekday>(idx);
}

LocalDate LocalDate::addDays(long days) const {
    return FromDays(daysSinceEpoch() + days);
}

std::string LocalDate::toIso() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::optional<LocalDate> ParseIsoDate(const std::string& text) {
    LocalDate date;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    if (!ReadInt(text, 0, 4, date.year) || !ReadInt(text, 5, 2, date.month) || !ReadInt(text, 8, 2, date.day)) {
        return std::nullopt;
    }
    if (date.month < 1 || date.month > 12) return std::nullopt;
    if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) return std::nullopt;
    return date;
}

std::string LocalDateTime::toIso() const {
    return date.toIso() + "T" + FormatClock(minuteOfDay);
}

std::optional<LocalDateTime> ParseIsoDateTime(const std::string& text) {
    if (text.size() < 16) return std::nullopt;
    auto date = ParseIsoDate(text.substr(0, 10));
    if (!date) return std::nullopt;
    if (text[10] != 'T' && text[10] != ' ') return std::nullopt;

    auto clock = ParseClock(text.substr(11, 5));
    if (!clock) return std::nullopt;

    if (text.size() > 16) {
        // Optional ":SS" followed by nothing else we care about (fraction, zone).
        int seconds = 0;
        if (text[16] != ':' || !ReadInt(text, 17, 2, seconds) || seconds > 59) {
            return std::nullopt;
        }
    }

    LocalDateTime dt;
    dt.date = *date;
    dt.minuteOfDay = *clock;
    return dt;
}

std::optional<int> ParseClock(const std::string& text) {
    int hours = 0;
    int minutes = 0;
    if (text.size() != 5 || text[2] != ':') return std::nullopt;
    if (!ReadInt(text, 0, 2, hours) || !ReadInt(text, 3, 2, minutes)) return std::nullopt;
    if (hours > 23 || minutes > 59) return std::nullopt;
    return hours * 60 + minutes;
}

std::string FormatClock(int minuteOfDay) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minuteOfDay / 60, minuteOfDay % 60);
    return buf;
}

long TimeWindow::distanceTo(const TimeWindow& other) const {
    if (absoluteEnd() < other.absoluteStart()) return other.absoluteStart() - absoluteEnd();
    if (other.absoluteEnd() < absoluteStart()) return absoluteStart() - other.absoluteEnd();
    return 0;
}

std::string TimeWindow::toString() const {
    std::ostringstream oss;
    oss << date.toIso() << " " << FormatClock(startMinute) << "-" << FormatClock(endMinute);
    return oss.str();
}

} // namespace schedsync::domain
