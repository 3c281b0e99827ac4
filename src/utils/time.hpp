#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace mailkeep::utils {

using TimePoint = std::chrono::system_clock::time_point;

// Clock source injected into stores and the sweeper; tests pin it.
using Clock = std::function<TimePoint()>;

// Current time truncated to whole milliseconds, the persisted precision.
TimePoint SystemNow();

inline Clock SystemClock() {
    return [] { return SystemNow(); };
}

inline std::chrono::hours Days(int days) {
    return std::chrono::hours(24LL * days);
}

TimePoint TruncateToMillis(TimePoint tp);

// "2026-10-18T10:39:00.123Z"
std::string FormatIso(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fraction and optional
// "Z" / "+HH:MM" / "-HH:MM" suffix. A missing zone is read as UTC.
std::optional<TimePoint> ParseIso(const std::string& text);

// "YYYY-MM" in local time, the archive partition of a file.
std::string MonthKey(TimePoint tp);

// Time-derived id: "<prefix>-<YYYYMMDDHHMMSSmmm>-<seq>". The sequence is
// process-wide and monotonic, so two calls never return the same id.
std::string GenerateRecordId(const std::string& prefix, TimePoint now);

TimePoint FromFileTime(std::filesystem::file_time_type file_time);
std::filesystem::file_time_type ToFileTime(TimePoint tp);

}  // namespace mailkeep::utils
