#include "core/date.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "core/errors.hpp"

namespace lotledger::core {

namespace {

bool read_digits(const std::string& text, size_t pos, size_t count, int& out) {
    out = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        out = out * 10 + (text[i] - '0');
    }
    return true;
}

}  // namespace

std::optional<Date> Date::parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

    Date d;
    if (!read_digits(text, 0, 4, d.year)) return std::nullopt;
    if (!read_digits(text, 5, 2, d.month)) return std::nullopt;
    if (!read_digits(text, 8, 2, d.day)) return std::nullopt;

    if (d.year < 1 || d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;
    return d;
}

std::string Date::to_string() const {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << '-'
       << std::setw(2) << month << '-' << std::setw(2) << day;
    return ss.str();
}

Date Date::next_day() const {
    Date d = *this;
    if (++d.day > days_in_month(d.year, d.month)) {
        d.day = 1;
        if (++d.month > 12) {
            d.month = 1;
            ++d.year;
        }
    }
    return d;
}

bool Date::is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int Date::days_in_month(int y, int m) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return kDays[m - 1];
}

Date parse_date_or_throw(const std::string& text, const std::string& field) {
    auto d = Date::parse(text);
    if (!d) {
        throw ValidationError(field + " must be a YYYY-MM-DD date, got '" + text + "'");
    }
    return *d;
}

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

}  // namespace lotledger::core
