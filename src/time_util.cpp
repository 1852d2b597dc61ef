#include "engram/time_util.hpp"
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace engram {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (Hinnant's algorithm).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool read_digits(const std::string& text, size_t& pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += count;
    return true;
}

bool expect(const std::string& text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace

std::string format_iso8601(Timestamp ts) {
    using namespace std::chrono;

    auto since_epoch = duration_cast<nanoseconds>(ts.time_since_epoch());
    auto days = duration_cast<seconds>(since_epoch).count() / 86400;
    auto nanos_of_day = since_epoch - duration_cast<nanoseconds>(seconds(days * 86400));
    if (nanos_of_day.count() < 0) {
        --days;
        nanos_of_day += hours(24);
    }

    int64_t year;
    unsigned month, day;
    civil_from_days(days, year, month, day);

    const int64_t total = nanos_of_day.count();
    const int64_t secs = total / 1000000000;
    const int64_t frac = total % 1000000000;

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day << 'T'
        << std::setw(2) << secs / 3600 << ':'
        << std::setw(2) << (secs / 60) % 60 << ':'
        << std::setw(2) << secs % 60 << '.';
    if (frac % 1000 == 0) {
        out << std::setw(6) << frac / 1000;
    } else {
        out << std::setw(9) << frac;
    }
    out << 'Z';
    return out.str();
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    using namespace std::chrono;

    size_t pos = 0;
    int year, month, day, hour, minute, second;
    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    int64_t offset_seconds = 0;
    if (pos < text.size()) {
        char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            ++pos;
            int oh, om;
            if (!read_digits(text, pos, 2, oh) || !expect(text, pos, ':') ||
                !read_digits(text, pos, 2, om)) {
                return std::nullopt;
            }
            offset_seconds = (oh * 3600 + om * 60) * (zone == '+' ? 1 : -1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t epoch_seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

    auto since_epoch = seconds(epoch_seconds) + nanoseconds(nanos);
    return Timestamp(duration_cast<Timestamp::duration>(since_epoch));
}

} // namespace engram
