/**
 * @file CalendarDate.hpp
 * @brief Value Object for the day-granular dates that key date nodes.
 */

#pragma once

#include <optional>
#include <string>

namespace taskweave::domain {

/**
 * @struct CalendarDate
 * @brief A proleptic Gregorian calendar day.
 */
struct CalendarDate {
    int year = 1970;   ///< Full year.
    int month = 1;     ///< 1..12.
    int day = 1;       ///< 1..31 depending on month.

    /** @brief Canonical "YYYY-MM-DD" key used by the dates index. */
    std::string toKey() const;

    /** @brief Returns the date shifted by a signed number of days. */
    CalendarDate addDays(long days) const;

    /** @brief True if year/month/day denote an existing calendar day. */
    bool isValid() const;

    /** @brief Current local date (process clock, day granularity). */
    static CalendarDate today();

    /**
     * @brief Checks the grammar `digits "-" digits "-" digits`.
     * @note Says nothing about calendar validity.
     */
    static bool matchesGrammar(const std::string& token);

    /**
     * @brief Parses a grammar-matching, calendar-valid token.
     * @return The date, or nullopt if the token is malformed or not a real day.
     */
    static std::optional<CalendarDate> parse(const std::string& token);

    /**
     * @brief Resolves "today", "tomorrow" and "yesterday" against @p reference.
     */
    static std::optional<CalendarDate> parseRelative(const std::string& token, const CalendarDate& reference);

    /**
     * @brief Extended parsing used when a token must be read as a date.
     *
     * Accepts absolute dates, relative keywords and month names ("jan",
     * "january", ...), the latter meaning the first day of that month in the
     * reference year.
     */
    static std::optional<CalendarDate> parseKeyword(const std::string& token, const CalendarDate& reference);

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

} // namespace taskweave::domain
