/**
 * @file Calendar.hpp
 * @brief Civil date/time value objects used by the scheduling domain.
 */

#pragma once

#include <optional>
#include <string>

namespace schedsync::domain {

enum class Weekday {
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
    Sunday
};

std::string WeekdayToString(Weekday day);

/** @brief Accepts "Mon", "monday", "TUE"... Returns nullopt on anything else. */
std::optional<Weekday> WeekdayFromString(const std::string& text);

/**
 * @struct LocalDate
 * @brief Proleptic Gregorian calendar date without a time zone.
 */
struct LocalDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    /** @brief Days relative to 1970-01-01. */
    long daysSinceEpoch() const;
    static LocalDate FromDays(long days);

    Weekday weekday() const;
    LocalDate addDays(long days) const;
    std::string toIso() const;

    bool operator==(const LocalDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const LocalDate& other) const { return !(*this == other); }
    bool operator<(const LocalDate& other) const { return daysSinceEpoch() < other.daysSinceEpoch(); }
};

std::optional<LocalDate> ParseIsoDate(const std::string& text);

/**
 * @struct LocalDateTime
 * @brief A date plus minute-of-day resolution. Seconds are dropped on parse.
 */
struct LocalDateTime {
    LocalDate date;
    int minuteOfDay = 0;

    std::string toIso() const;

    bool operator==(const LocalDateTime& other) const {
        return date == other.date && minuteOfDay == other.minuteOfDay;
    }
    bool operator!=(const LocalDateTime& other) const { return !(*this == other); }
};

/** @brief Parses "YYYY-MM-DDTHH:MM[:SS]" or "YYYY-MM-DD HH:MM[:SS]". */
std::optional<LocalDateTime> ParseIsoDateTime(const std::string& text);

/** @brief "HH:MM" to minutes since midnight. */
std::optional<int> ParseClock(const std::string& text);
std::string FormatClock(int minuteOfDay);

/**
 * @struct TimeWindow
 * @brief A concrete interval on one calendar day, [startMinute, endMinute).
 */
struct TimeWindow {
    LocalDate date;
    int startMinute = 0;
    int endMinute = 0;

    long absoluteStart() const { return date.daysSinceEpoch() * 1440L + startMinute; }
    long absoluteEnd() const { return date.daysSinceEpoch() * 1440L + endMinute; }

    bool overlaps(const TimeWindow& other) const {
        return absoluteStart() < other.absoluteEnd() && other.absoluteStart() < absoluteEnd();
    }

    /** @brief Minutes separating the two windows, 0 when they overlap or touch. */
    long distanceTo(const TimeWindow& other) const;

    std::string toString() const;
};

} // namespace schedsync::domain
