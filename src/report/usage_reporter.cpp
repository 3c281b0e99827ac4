#include "report/usage_reporter.hpp"

#include <iomanip>
#include <sstream>
#include <system_error>

#include "config/config_loader.hpp"
#include "history/history_store.hpp"
#include "plans/plan_store.hpp"
#include "sweeper/artifact_sweeper.hpp"
#include "utils/logging.hpp"

namespace mailkeep::report {
namespace {

std::uintmax_t FileSize(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

// Regular files directly in dir, or anywhere below it when recursive.
void CountFiles(const std::filesystem::path& dir,
                bool recursive,
                std::size_t& count,
                std::uintmax_t& bytes) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return;
    }
    auto visit = [&](const std::filesystem::directory_entry& entry) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec)) {
            ++count;
            bytes += FileSize(entry.path());
        }
    };
    if (recursive) {
        std::filesystem::recursive_directory_iterator it(dir, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            visit(*it);
        }
    } else {
        std::filesystem::directory_iterator it(dir, ec);
        for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            visit(*it);
        }
    }
    if (ec) {
        utils::LogWarn("report", "directory scan incomplete", {{"path", dir.string()}, {"error", ec.message()}});
    }
}

DirectoryUsage ScanDirectory(const std::string& label,
                             const std::filesystem::path& dir,
                             bool with_archive) {
    DirectoryUsage usage;
    usage.label = label;
    usage.path = dir;
    std::error_code ec;
    usage.exists = std::filesystem::is_directory(dir, ec);
    if (!usage.exists) {
        return usage;
    }
    CountFiles(dir, false, usage.file_count, usage.size_bytes);
    if (with_archive) {
        CountFiles(sweeper::ArtifactSweeper::ArchiveDir(dir), true,
                   usage.archived_file_count, usage.archived_size_bytes);
    }
    return usage;
}

void PrintHeader(std::ostringstream& out, const std::string& title) {
    out << "\n" << std::string(70, '=') << "\n"
        << "  " << title << "\n"
        << std::string(70, '=') << "\n";
}

void PrintCounts(std::ostringstream& out,
                 const std::string& heading,
                 const std::map<std::string, std::size_t>& counts,
                 const std::string& unit) {
    out << "\n" << heading << ":\n";
    if (counts.empty()) {
        out << "  (none)\n";
        return;
    }
    for (const auto& [key, count] : counts) {
        out << "  " << std::left << std::setw(20) << key << " "
            << std::right << std::setw(4) << count << " " << unit << "\n";
    }
}

void PrintStore(std::ostringstream& out, const StoreUsage& store, bool force_cleanup) {
    out << std::left << std::setw(20) << store.label << " ";
    if (!store.exists) {
        out << std::right << std::setw(20) << "NOT FOUND" << "\n";
        return;
    }
    out << std::right << std::setw(10) << FormatBytes(store.size_bytes)
        << "  (" << store.record_count << " entries)";
    if (force_cleanup) {
        out << "  cleanup: " << store.cleaned_removed << " removed, "
            << store.cleaned_archived << " archived";
    }
    out << "\n";
}

void PrintDirectory(std::ostringstream& out, const DirectoryUsage& dir, bool with_archive) {
    out << std::left << std::setw(20) << dir.label << " ";
    if (!dir.exists) {
        out << std::right << std::setw(20) << "NOT FOUND" << "  " << dir.path.string() << "\n";
        return;
    }
    out << std::right << std::setw(10) << FormatBytes(dir.size_bytes)
        << "  (" << dir.file_count << " files)  " << dir.path.string() << "\n";
    if (with_archive) {
        out << std::left << std::setw(20) << "  archived" << " "
            << std::right << std::setw(10) << FormatBytes(dir.archived_size_bytes)
            << "  (" << dir.archived_file_count << " files)\n";
    }
}

}  // namespace

UsageReporter::UsageReporter(config::Config config, utils::Clock clock)
    : config_(std::move(config))
    , clock_(clock ? std::move(clock) : utils::SystemClock()) {}

UsageReport UsageReporter::Report(bool force_cleanup) const {
    UsageReport report;
    report.generated_at = clock_();
    report.force_cleanup = force_cleanup;
    report.history = ReportHistory(force_cleanup);
    report.plans = ReportPlans(force_cleanup);
    report.outputs = ScanDirectory("Outputs", config::OutputsPath(config_), true);
    report.traces = ScanDirectory("Traces", config::TracesPath(config_), false);
    return report;
}

StoreUsage UsageReporter::ReportHistory(bool force_cleanup) const {
    StoreUsage usage;
    usage.label = "Email History";
    usage.path = config::HistoryStorePath(config_);

    history::HistoryStore store(usage.path, config_.history, clock_);
    usage.exists = store.Persisted();
    if (force_cleanup && usage.exists) {
        const auto outcome = store.ApplyRetention();
        usage.cleaned_removed = outcome.removed;
        usage.cleaned_archived = outcome.archived;
    }
    const auto stats = store.Stats();
    usage.record_count = stats.total_entries;
    usage.by_group = stats.entries_by_group;
    usage.size_bytes = usage.exists ? FileSize(usage.path) : 0;
    return usage;
}

StoreUsage UsageReporter::ReportPlans(bool force_cleanup) const {
    StoreUsage usage;
    usage.label = "Campaign Plans";
    usage.path = config::PlanStorePath(config_);

    plans::PlanStore store(usage.path, config_.plans, clock_);
    usage.exists = store.Persisted();
    if (force_cleanup && usage.exists) {
        const auto outcome = store.ApplyRetention();
        usage.cleaned_removed = outcome.removed;
        usage.cleaned_archived = outcome.archived;
    }
    const auto stats = store.Stats();
    usage.record_count = stats.total_plans;
    usage.by_group = stats.plans_by_group;
    usage.by_status = stats.plans_by_status;
    usage.size_bytes = usage.exists ? FileSize(usage.path) : 0;
    return usage;
}

std::string FormatBytes(std::uintmax_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    if (bytes < 1024 * 1024) {
        out << static_cast<double>(bytes) / 1024.0 << " KB";
    } else {
        out << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    }
    return out.str();
}

std::string FormatPolicies(const config::Config& config) {
    std::ostringstream out;
    PrintHeader(out, "RETENTION POLICIES");
    out << "EMAIL HISTORY:\n"
        << "  - Keep last " << config.history.max_per_group << " entries per brand\n"
        << "  - Hard limit: " << config.history.max_total << " total entries\n"
        << "  - Applied on every write\n"
        << "\nCAMPAIGN PLANS:\n"
        << "  - Keep at most " << config.plans.max_active_per_group << " active plans per brand\n"
        << "  - Archive completed plans after " << config.plans.archive_after_days << " days\n"
        << "  - Delete archived plans after " << config.plans.delete_after_days << " days\n"
        << "  - Applied on every write\n"
        << "\nARTIFACTS (mailkeep sweep-artifacts):\n"
        << "  - Archive outputs older than " << config.sweeper.archive_days << " days\n"
        << "  - Delete traces older than " << config.sweeper.trace_retention_days << " days\n";
    return out.str();
}

std::string FormatReport(const UsageReport& report, const config::Config& config) {
    std::ostringstream out;
    out << "mailkeep usage report " << utils::FormatIso(report.generated_at) << "\n";

    PrintHeader(out, "DATA FILE STATISTICS");
    PrintStore(out, report.history, report.force_cleanup);
    PrintStore(out, report.plans, report.force_cleanup);

    PrintHeader(out, "EMAIL HISTORY STATISTICS");
    out << "Total Entries:        " << report.history.record_count << "\n"
        << "Brands:               " << report.history.by_group.size() << "\n";
    PrintCounts(out, "Entries by Brand", report.history.by_group, "emails");

    PrintHeader(out, "CAMPAIGN PLAN STATISTICS");
    out << "Total Plans:          " << report.plans.record_count << "\n"
        << "Brands:               " << report.plans.by_group.size() << "\n";
    PrintCounts(out, "Plans by Status", report.plans.by_status, "plans");
    PrintCounts(out, "Plans by Brand", report.plans.by_group, "plans");

    PrintHeader(out, "ARTIFACT DIRECTORIES");
    PrintDirectory(out, report.outputs, true);
    PrintDirectory(out, report.traces, false);

    out << FormatPolicies(config);
    return out.str();
}

}  // namespace mailkeep::report
