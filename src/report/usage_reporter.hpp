#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "config/config_schema.hpp"
#include "utils/time.hpp"

namespace mailkeep::report {

struct StoreUsage {
    std::string label;
    std::filesystem::path path;
    bool exists = false;
    std::uintmax_t size_bytes = 0;
    std::size_t record_count = 0;
    std::map<std::string, std::size_t> by_group;
    std::map<std::string, std::size_t> by_status;
    // Filled only after a forced cleanup.
    std::size_t cleaned_removed = 0;
    std::size_t cleaned_archived = 0;
};

struct DirectoryUsage {
    std::string label;
    std::filesystem::path path;
    bool exists = false;
    std::size_t file_count = 0;
    std::uintmax_t size_bytes = 0;
    std::size_t archived_file_count = 0;
    std::uintmax_t archived_size_bytes = 0;
};

struct UsageReport {
    utils::TimePoint generated_at{};
    bool force_cleanup = false;
    StoreUsage history;
    StoreUsage plans;
    DirectoryUsage outputs;
    DirectoryUsage traces;
};

// Read-only view of what mailkeep keeps on disk. The stores and their policies
// do all trimming; the reporter only asks them to run when forced.
class UsageReporter {
public:
    explicit UsageReporter(config::Config config, utils::Clock clock = utils::SystemClock());

    // Throws CorruptStoreError when a store file does not parse.
    UsageReport Report(bool force_cleanup = false) const;

private:
    StoreUsage ReportHistory(bool force_cleanup) const;
    StoreUsage ReportPlans(bool force_cleanup) const;

    config::Config config_;
    utils::Clock clock_;
};

std::string FormatBytes(std::uintmax_t bytes);
std::string FormatPolicies(const config::Config& config);
std::string FormatReport(const UsageReport& report, const config::Config& config);

}  // namespace mailkeep::report
