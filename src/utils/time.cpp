#include "utils/time.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mailkeep::utils {
namespace {

std::tm ToUtc(std::time_t time) {
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &time);
#else
    gmtime_r(&time, &utc);
#endif
    return utc;
}

std::tm ToLocal(std::time_t time) {
    std::tm local_time{};
#if defined(_WIN32)
    localtime_s(&local_time, &time);
#else
    localtime_r(&time, &local_time);
#endif
    return local_time;
}

std::time_t FromUtc(std::tm* utc) {
#if defined(_WIN32)
    return _mkgmtime(utc);
#else
    return timegm(utc);
#endif
}

bool ReadDigits(const std::string& text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool Expect(const std::string& text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

}  // namespace

TimePoint TruncateToMillis(TimePoint tp) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
}

TimePoint SystemNow() {
    return TruncateToMillis(std::chrono::system_clock::now());
}

std::string FormatIso(TimePoint tp) {
    const auto millis_total = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    auto seconds = millis_total / 1000;
    auto millis = millis_total % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }
    const auto utc = ToUtc(static_cast<std::time_t>(seconds));
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

std::optional<TimePoint> ParseIso(const std::string& text) {
    std::tm tm{};
    std::size_t pos = 0;
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') ||
        !ReadDigits(text, pos, 2, minute) || !Expect(text, pos, ':') ||
        !ReadDigits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    long long millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        long long fraction = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                fraction = fraction * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            fraction *= 10;
        }
        millis = fraction;
    }

    long long offset_minutes = 0;
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            ++pos;
            int offset_hour = 0;
            int offset_minute = 0;
            if (!ReadDigits(text, pos, 2, offset_hour) || !Expect(text, pos, ':') ||
                !ReadDigits(text, pos, 2, offset_minute)) {
                return std::nullopt;
            }
            offset_minutes = offset_hour * 60 + offset_minute;
            if (zone == '-') {
                offset_minutes = -offset_minutes;
            }
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const auto seconds = FromUtc(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    TimePoint tp = std::chrono::system_clock::from_time_t(seconds);
    tp += std::chrono::milliseconds(millis);
    tp -= std::chrono::minutes(offset_minutes);
    return TruncateToMillis(tp);
}

std::string MonthKey(TimePoint tp) {
    const auto local_time = ToLocal(std::chrono::system_clock::to_time_t(tp));
    char buffer[8];
    std::strftime(buffer, sizeof(buffer), "%Y-%m", &local_time);
    return std::string(buffer);
}

std::string GenerateRecordId(const std::string& prefix, TimePoint now) {
    static std::atomic<unsigned long long> sequence{0};
    const auto seq = sequence.fetch_add(1) + 1;
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    const auto utc = ToUtc(std::chrono::system_clock::to_time_t(now));
    std::ostringstream oss;
    if (!prefix.empty()) {
        oss << prefix << '-';
    }
    oss << std::put_time(&utc, "%Y%m%d%H%M%S")
        << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis)
        << '-' << std::setw(4) << std::setfill('0') << seq;
    return oss.str();
}

TimePoint FromFileTime(std::filesystem::file_time_type file_time) {
    const auto file_now = std::filesystem::file_time_type::clock::now();
    const auto system_now = std::chrono::system_clock::now();
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        file_time - file_now + system_now);
}

std::filesystem::file_time_type ToFileTime(TimePoint tp) {
    const auto file_now = std::filesystem::file_time_type::clock::now();
    const auto system_now = std::chrono::system_clock::now();
    return std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        tp - system_now + file_now);
}

}  // namespace mailkeep::utils
