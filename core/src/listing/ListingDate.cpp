// Date parsing for Unix and DOS listing dialects.
#include "remotefs/ListingDate.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <vector>

namespace remotefs {

namespace {

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) return 29;
    return kDays[m - 1];
}

// Days since 1970-01-01 for a civil date (H. Hinnant's algorithm).
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2));
}

std::string toLower(const std::string& s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// Strict decimal: digits only, at most maxDigits of them.
std::optional<int> parseNumber(const std::string& s, std::size_t maxDigits = 4) {
    if (s.empty() || s.size() > maxDigits) return std::nullopt;
    int v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        v = v * 10 + (c - '0');
    }
    return v;
}

std::vector<std::string> splitOn(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    parts.push_back(cur);
    return parts;
}

// "HH:MM" or "HH:MM:SS", optionally followed by AM/PM.
bool parseClock(const std::string& token, int& hour, int& minute, int& second) {
    std::string t = toLower(token);
    int meridiem = 0; // 0 none, 1 am, 2 pm
    if (t.size() > 2 && (t.compare(t.size() - 2, 2, "am") == 0 || t.compare(t.size() - 2, 2, "pm") == 0)) {
        meridiem = (t[t.size() - 2] == 'a') ? 1 : 2;
        t.resize(t.size() - 2);
    }
    auto fields = splitOn(t, ':');
    if (fields.size() < 2 || fields.size() > 3) return false;
    auto h = parseNumber(fields[0], 2);
    auto mi = parseNumber(fields[1], 2);
    if (!h || !mi || fields[1].size() != 2) return false;
    int s = 0;
    if (fields.size() == 3) {
        auto sv = parseNumber(fields[2], 2);
        if (!sv || fields[2].size() != 2) return false;
        s = *sv;
    }
    int hv = *h;
    if (meridiem != 0) {
        if (hv < 1 || hv > 12) return false;
        if (meridiem == 1 && hv == 12) hv = 0;
        if (meridiem == 2 && hv != 12) hv += 12;
    }
    if (hv > 23 || *mi > 59 || s > 59) return false;
    hour = hv;
    minute = *mi;
    second = s;
    return true;
}

} // namespace

std::optional<std::int64_t> makeUtcTimestamp(int year, int month, int day,
                                             int hour, int minute, int second) {
    if (year < 1 || year > 9999) return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59)
        return std::nullopt;
    const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * 86400 + hour * 3600 + minute * 60 + second;
}

std::optional<int> parseMonth(const std::string& token) {
    static const char* const kNames[12] = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"
    };
    const std::string t = toLower(token);
    if (t.empty()) return std::nullopt;
    if (auto n = parseNumber(t, 2)) {
        if (*n >= 1 && *n <= 12) return *n;
        return std::nullopt;
    }
    if (t == "sept") return 9;
    for (int i = 0; i < 12; ++i) {
        const std::string full = kNames[i];
        if (t == full || (t.size() == 3 && full.compare(0, 3, t) == 0)) return i + 1;
    }
    return std::nullopt;
}

std::optional<std::int64_t> parseUnixListingDate(const std::string& month,
                                                 const std::string& day,
                                                 const std::string& timeOrYear,
                                                 int referenceYear) {
    auto m = parseMonth(month);
    auto d = parseNumber(day, 2);
    if (!m || !d) return std::nullopt;

    if (timeOrYear.find(':') != std::string::npos) {
        int h = 0, mi = 0, s = 0;
        if (!parseClock(timeOrYear, h, mi, s)) return std::nullopt;
        return makeUtcTimestamp(referenceYear, *m, *d, h, mi, s);
    }
    auto y = parseNumber(timeOrYear, 4);
    if (!y || timeOrYear.size() != 4) return std::nullopt;
    return makeUtcTimestamp(*y, *m, *d);
}

std::optional<std::int64_t> parseDosListingDate(const std::string& date,
                                                const std::string& time) {
    const char sep = date.find('/') != std::string::npos ? '/' : '-';
    auto fields = splitOn(date, sep);
    if (fields.size() != 3) return std::nullopt;

    int year = 0, month = 0, day = 0;
    if (fields[0].size() == 4) {
        auto y = parseNumber(fields[0], 4);
        auto m = parseNumber(fields[1], 2);
        auto d = parseNumber(fields[2], 2);
        if (!y || !m || !d) return std::nullopt;
        year = *y; month = *m; day = *d;
    } else {
        auto m = parseNumber(fields[0], 2);
        auto d = parseNumber(fields[1], 2);
        auto y = parseNumber(fields[2], 4);
        if (!m || !d || !y) return std::nullopt;
        if (fields[2].size() == 2) {
            year = (*y < 50) ? 2000 + *y : 1900 + *y;
        } else if (fields[2].size() == 4) {
            year = *y;
        } else {
            return std::nullopt;
        }
        month = *m; day = *d;
    }

    int h = 0, mi = 0, s = 0;
    if (!parseClock(time, h, mi, s)) return std::nullopt;
    return makeUtcTimestamp(year, month, day, h, mi, s);
}

std::string formatUtcTimestamp(std::int64_t epochSeconds) {
    std::int64_t days = epochSeconds / 86400;
    std::int64_t rem = epochSeconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    int y = 0, m = 0, d = 0;
    civilFromDays(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  y, m, d,
                  static_cast<int>(rem / 3600),
                  static_cast<int>((rem % 3600) / 60),
                  static_cast<int>(rem % 60));
    return buf;
}

int currentUtcYear() {
    std::time_t now = std::time(nullptr);
    std::tm tmv{};
    gmtime_r(&now, &tmv);
    return tmv.tm_year + 1900;
}

} // namespace remotefs
