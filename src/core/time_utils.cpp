#include <taskfed/core/time_utils.h>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace taskfed::time {

namespace {

bool readDigits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c)) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

std::string formatIso8601(TimePoint tp) {
    auto millis = toEpochMillis(tp);
    auto seconds = millis / 1000;
    auto fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        seconds -= 1;
    }

    std::time_t tt = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(fraction));
    return buf;
}

std::optional<TimePoint> parseIso8601(const std::string& isoStr) {
    std::tm tm{};
    int year = 0, month = 0, day = 0;
    if (!readDigits(isoStr, 0, 4, year) || isoStr.size() < 10 || isoStr[4] != '-' ||
        !readDigits(isoStr, 5, 2, month) || isoStr[7] != '-' || !readDigits(isoStr, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;

    size_t pos = 10;
    int64_t millis = 0;
    int offsetMinutes = 0;

    if (pos < isoStr.size()) {
        if (isoStr[pos] != 'T' && isoStr[pos] != 't' && isoStr[pos] != ' ') {
            return std::nullopt;
        }
        int hour = 0, minute = 0, second = 0;
        if (!readDigits(isoStr, pos + 1, 2, hour) || pos + 3 >= isoStr.size() ||
            isoStr[pos + 3] != ':' || !readDigits(isoStr, pos + 4, 2, minute) ||
            pos + 6 >= isoStr.size() || isoStr[pos + 6] != ':' ||
            !readDigits(isoStr, pos + 7, 2, second)) {
            return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        pos += 9;

        if (pos < isoStr.size() && isoStr[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < isoStr.size() && std::isdigit(static_cast<unsigned char>(isoStr[pos]))) {
                if (digits < 3) {
                    millis = millis * 10 + (isoStr[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                return std::nullopt;
            }
            for (int i = digits; i < 3; ++i) {
                millis *= 10;
            }
        }

        if (pos < isoStr.size()) {
            char tz = isoStr[pos];
            if (tz == 'Z' || tz == 'z') {
                ++pos;
            } else if (tz == '+' || tz == '-') {
                int oh = 0, om = 0;
                if (!readDigits(isoStr, pos + 1, 2, oh)) {
                    return std::nullopt;
                }
                size_t next = pos + 3;
                if (next < isoStr.size() && isoStr[next] == ':') {
                    ++next;
                }
                if (next < isoStr.size()) {
                    if (!readDigits(isoStr, next, 2, om)) {
                        return std::nullopt;
                    }
                    next += 2;
                }
                offsetMinutes = (oh * 60 + om) * (tz == '+' ? 1 : -1);
                pos = next;
            } else {
                return std::nullopt;
            }
        }
        if (pos != isoStr.size()) {
            return std::nullopt;
        }
    }

    std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1) && year != 1969) {
        return std::nullopt;
    }

    auto tp = std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
    return tp - std::chrono::minutes(offsetMinutes);
}

int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t millis) {
    return TimePoint{std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(millis))};
}

} // namespace taskfed::time
