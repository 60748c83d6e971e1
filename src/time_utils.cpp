#include "time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace {

bool ReadDigits(const std::string &s, size_t pos, size_t count, int &out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

std::tm ToTm(double ms, TimeBasis basis) {
    const std::time_t t = static_cast<std::time_t>(std::floor(ms / 1000.0));
    std::tm out{};
    if (basis == BASIS_UTC) {
        gmtime_r(&t, &out);
    } else {
        localtime_r(&t, &out);
    }
    return out;
}

std::string FormatTm(const std::tm &tm, const char *fmt) {
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

} // namespace

// ─────────────────────────────────────
std::optional<double> ParseIsoMs(const std::string &iso) {
    using namespace std::chrono;

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!ReadDigits(iso, 0, 4, y) || !ReadDigits(iso, 5, 2, mo) || !ReadDigits(iso, 8, 2, d) ||
        !ReadDigits(iso, 11, 2, h) || !ReadDigits(iso, 14, 2, mi) ||
        !ReadDigits(iso, 17, 2, s)) {
        return std::nullopt;
    }
    if (iso[4] != '-' || iso[7] != '-' || iso[13] != ':' || iso[16] != ':') {
        return std::nullopt;
    }
    if (iso[10] != 'T' && iso[10] != 't' && iso[10] != ' ') {
        return std::nullopt;
    }
    if (h > 23 || mi > 59 || s > 59) {
        return std::nullopt;
    }

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                             day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    size_t pos = 19;
    double fraction = 0.0;
    if (pos < iso.size() && iso[pos] == '.') {
        ++pos;
        double scale = 100.0;
        const size_t digitsStart = pos;
        while (pos < iso.size() && iso[pos] >= '0' && iso[pos] <= '9') {
            fraction += (iso[pos] - '0') * scale;
            scale /= 10.0;
            ++pos;
        }
        if (pos == digitsStart) {
            return std::nullopt;
        }
    }

    int offsetMinutes = 0;
    if (pos < iso.size()) {
        const char zone = iso[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int oh = 0, om = 0;
            if (!ReadDigits(iso, pos + 1, 2, oh)) {
                return std::nullopt;
            }
            size_t minutesAt = pos + 3;
            if (minutesAt < iso.size() && iso[minutesAt] == ':') {
                ++minutesAt;
            }
            if (!ReadDigits(iso, minutesAt, 2, om) || oh > 23 || om > 59) {
                return std::nullopt;
            }
            offsetMinutes = (zone == '+' ? 1 : -1) * (oh * 60 + om);
            pos = minutesAt + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != iso.size()) {
        return std::nullopt;
    }

    const double dayMs = duration<double, std::milli>(sys_days{ymd}.time_since_epoch()).count();
    const double result = dayMs + h * kHourMs + mi * 60000.0 + s * 1000.0 + std::floor(fraction) -
                          offsetMinutes * 60000.0;
    if (!std::isfinite(result)) {
        return std::nullopt;
    }
    return result;
}

// ─────────────────────────────────────
std::string FormatIsoMs(double ms) {
    using namespace std::chrono;

    if (!std::isfinite(ms)) {
        ms = 0.0;
    }
    const sys_time<milliseconds> tp{milliseconds{static_cast<int64_t>(std::floor(ms))}};
    const auto dp = floor<days>(tp);
    const year_month_day ymd{dp};
    const hh_mm_ss<milliseconds> hms{tp - dp};

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()),
                  static_cast<int>(hms.subseconds().count()));
    return buf;
}

// ─────────────────────────────────────
double FloorToHourMs(double ms) {
    return std::floor(ms / kHourMs) * kHourMs;
}

// ─────────────────────────────────────
int HourOfDay(double ms, TimeBasis basis) {
    return ToTm(ms, basis).tm_hour;
}

// ─────────────────────────────────────
int ShiftHourToDayStart(int hour, int dayStartHour) {
    return ((hour - dayStartHour) % 24 + 24) % 24;
}

// ─────────────────────────────────────
int UnshiftHourFromDayStart(int shiftedHour, int dayStartHour) {
    return ((shiftedHour + dayStartHour) % 24 + 24) % 24;
}

// ─────────────────────────────────────
double LocalDayStartMs(double referenceMs, int dayStartHour, TimeBasis basis) {
    if (basis == BASIS_UTC) {
        double midnight = std::floor(referenceMs / kDayMs) * kDayMs;
        if (HourOfDay(referenceMs, BASIS_UTC) < dayStartHour) {
            midnight -= kDayMs;
        }
        return midnight + dayStartHour * kHourMs;
    }

    std::tm tm = ToTm(referenceMs, BASIS_LOCAL);
    if (tm.tm_hour < dayStartHour) {
        tm.tm_mday -= 1;
    }
    tm.tm_hour = dayStartHour;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return static_cast<double>(std::mktime(&tm)) * 1000.0;
}

// ─────────────────────────────────────
std::string DayKey(double ms, TimeBasis basis) {
    return FormatTm(ToTm(ms, basis), "%Y-%m-%d");
}

// ─────────────────────────────────────
std::string HourLabel(double ms, TimeBasis basis) {
    return FormatTm(ToTm(ms, basis), "%H:%M");
}

// ─────────────────────────────────────
std::string DateLabel(double ms, TimeBasis basis) {
    return FormatTm(ToTm(ms, basis), "%b %d");
}

// ─────────────────────────────────────
int ClampDays(int days) {
    return std::clamp(days, 1, 365);
}

// ─────────────────────────────────────
int ClampWindowHours(int hours) {
    return std::clamp(hours, 1, 168);
}
