/**
 * @file CalendarDate.cpp
 * @brief Implementation of CalendarDate.
 */

#include "domain/CalendarDate.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace taskweave::domain {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) return 29;
    return kDays[month - 1];
}

// Civil-from-days conversions (Gregorian, day 0 = 1970-01-01).
long DaysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = static_cast<long>(y) - era * 400;
    const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CivilFromDays(long z) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const long doe = z - era * 146097;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp = (5 * doy + 2) / 153;
    CalendarDate date;
    date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool IsDigits(const std::string& text, size_t begin, size_t end) {
    if (begin >= end) return false;
    for (size_t i = begin; i < end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    return true;
}

} // namespace

std::string CalendarDate::toKey() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

CalendarDate CalendarDate::addDays(long days) const {
    return CivilFromDays(DaysFromCivil(year, month, day) + days);
}

bool CalendarDate::isValid() const {
    if (month < 1 || month > 12) return false;
    if (day < 1) return false;
    return day <= DaysInMonth(year, month);
}

CalendarDate CalendarDate::today() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm = ToLocalTime(tt);
    return CalendarDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

bool CalendarDate::matchesGrammar(const std::string& token) {
    size_t first = token.find('-');
    if (first == std::string::npos) return false;
    size_t second = token.find('-', first + 1);
    if (second == std::string::npos) return false;
    return IsDigits(token, 0, first) &&
           IsDigits(token, first + 1, second) &&
           IsDigits(token, second + 1, token.size());
}

std::optional<CalendarDate> CalendarDate::parse(const std::string& token) {
    if (!matchesGrammar(token)) return std::nullopt;

    size_t first = token.find('-');
    size_t second = token.find('-', first + 1);

    // Overlong components cannot be real dates; avoids stoi overflow.
    if (first > 6 || second - first - 1 > 2 || token.size() - second - 1 > 2) {
        return std::nullopt;
    }

    CalendarDate date;
    date.year = std::stoi(token.substr(0, first));
    date.month = std::stoi(token.substr(first + 1, second - first - 1));
    date.day = std::stoi(token.substr(second + 1));
    if (!date.isValid()) return std::nullopt;
    return date;
}

std::optional<CalendarDate> CalendarDate::parseRelative(const std::string& token, const CalendarDate& reference) {
    if (token == "today") return reference;
    if (token == "tomorrow") return reference.addDays(1);
    if (token == "yesterday") return reference.addDays(-1);
    return std::nullopt;
}

std::optional<CalendarDate> CalendarDate::parseKeyword(const std::string& token, const CalendarDate& reference) {
    if (auto absolute = parse(token)) return absolute;

    std::string lower = ToLower(token);
    if (auto relative = parseRelative(lower, reference)) return relative;

    static const char* kMonths[][2] = {
        {"jan", "january"}, {"feb", "february"}, {"mar", "march"},
        {"apr", "april"},   {"may", "may"},      {"jun", "june"},
        {"jul", "july"},    {"aug", "august"},   {"sep", "september"},
        {"oct", "october"}, {"nov", "november"}, {"dec", "december"}
    };
    for (int i = 0; i < 12; ++i) {
        if (lower == kMonths[i][0] || lower == kMonths[i][1]) {
            return CalendarDate{reference.year, i + 1, 1};
        }
    }
    return std::nullopt;
}

} // namespace taskweave::domain
