#pragma once

#include <optional>
#include <string>
#include <tuple>

namespace lotledger::core {

/// Calendar date (no time zone). Transactions and valuations are dated, not timestamped.
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    /// Parse a strict YYYY-MM-DD string. Returns nullopt for anything else,
    /// including impossible days such as 2023-02-29.
    static std::optional<Date> parse(const std::string& text);

    std::string to_string() const;

    Date next_day() const;

    static bool is_leap_year(int year);
    static int days_in_month(int year, int month);

    friend bool operator==(const Date& a, const Date& b) {
        return std::tie(a.year, a.month, a.day) == std::tie(b.year, b.month, b.day);
    }
    friend bool operator!=(const Date& a, const Date& b) { return !(a == b); }
    friend bool operator<(const Date& a, const Date& b) {
        return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
    }
    friend bool operator>(const Date& a, const Date& b) { return b < a; }
    friend bool operator<=(const Date& a, const Date& b) { return !(b < a); }
    friend bool operator>=(const Date& a, const Date& b) { return !(a < b); }
};

/// Parse or throw ValidationError naming the offending field.
Date parse_date_or_throw(const std::string& text, const std::string& field);

/// UTC wall-clock timestamp, ISO-8601 with milliseconds.
std::string current_timestamp();

}  // namespace lotledger::core
