#include "sweeper/artifact_sweeper.hpp"

#include <optional>
#include <system_error>

#include "utils/logging.hpp"

namespace mailkeep::sweeper {
namespace {

// Regular files directly inside dir, collected before anything is moved.
std::vector<std::filesystem::path> ListFiles(const std::filesystem::path& dir,
                                             std::vector<utils::ArtifactIOError>& errors) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        errors.push_back({dir.string(), "cannot list directory: " + ec.message()});
        return files;
    }
    const std::filesystem::directory_iterator end;
    while (it != end) {
        files.push_back(it->path());
        it.increment(ec);
        if (ec) {
            errors.push_back({dir.string(), "directory listing interrupted: " + ec.message()});
            break;
        }
    }
    return files;
}

// Last-modified time of a regular file, or std::nullopt when it should be
// skipped. Failures other than "not a regular file" are recorded.
std::optional<utils::TimePoint> ModifiedAt(const std::filesystem::path& path,
                                           std::vector<utils::ArtifactIOError>& errors) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        errors.push_back({path.string(), "file vanished before it could be swept"});
        return std::nullopt;
    }
    if (ec) {
        errors.push_back({path.string(), "cannot stat: " + ec.message()});
        return std::nullopt;
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::nullopt;
    }
    const auto modified = std::filesystem::last_write_time(path, ec);
    if (ec) {
        errors.push_back({path.string(), "cannot read modification time: " + ec.message()});
        return std::nullopt;
    }
    return utils::FromFileTime(modified);
}

}  // namespace

ArtifactSweeper::ArtifactSweeper(std::filesystem::path outputs_dir,
                                 std::filesystem::path traces_dir,
                                 config::SweeperConfig config,
                                 utils::Clock clock)
    : outputs_dir_(std::move(outputs_dir))
    , traces_dir_(std::move(traces_dir))
    , config_(std::move(config))
    , clock_(clock ? std::move(clock) : utils::SystemClock()) {}

SweepReport ArtifactSweeper::Sweep() {
    SweepReport report;
    const auto now = clock_();
    ArchiveOutputs(report, now);
    DeleteTraces(report, now);
    utils::LogInfo("sweep", "finished", {
        {"archived", std::to_string(report.archived_count)},
        {"deleted", std::to_string(report.deleted_count)},
        {"errors", std::to_string(report.errors.size())}});
    return report;
}

std::filesystem::path ArtifactSweeper::ArchiveDir(const std::filesystem::path& outputs_dir) {
    return outputs_dir / "archive";
}

void ArtifactSweeper::ArchiveOutputs(SweepReport& report, utils::TimePoint now) {
    std::error_code ec;
    if (!std::filesystem::is_directory(outputs_dir_, ec)) {
        utils::LogInfo("sweep", "no outputs directory", {{"path", outputs_dir_.string()}});
        return;
    }
    const auto max_age = utils::Days(config_.archive_days);
    for (const auto& path : ListFiles(outputs_dir_, report.errors)) {
        if (!Matches(path, config_.output_extension)) {
            continue;
        }
        const auto modified = ModifiedAt(path, report.errors);
        if (!modified.has_value() || now - *modified <= max_age) {
            continue;
        }
        const auto month = utils::MonthKey(*modified);
        const auto target_dir = ArchiveDir(outputs_dir_) / month;
        std::filesystem::create_directories(target_dir, ec);
        if (ec) {
            report.errors.push_back({path.string(), "cannot create " + target_dir.string() + ": " + ec.message()});
            continue;
        }
        if (!MoveArtifact(path, target_dir / path.filename(), ec)) {
            report.errors.push_back({path.string(), "cannot archive: " + ec.message()});
            utils::LogWarn("sweep", "archive failed", {{"path", path.string()}, {"error", ec.message()}});
            continue;
        }
        ++report.archived_count;
        utils::LogInfo("sweep", "archived", {{"file", path.filename().string()}, {"month", month}});
    }
}

void ArtifactSweeper::DeleteTraces(SweepReport& report, utils::TimePoint now) {
    std::error_code ec;
    if (!std::filesystem::is_directory(traces_dir_, ec)) {
        utils::LogInfo("sweep", "no traces directory", {{"path", traces_dir_.string()}});
        return;
    }
    const auto max_age = utils::Days(config_.trace_retention_days);
    for (const auto& path : ListFiles(traces_dir_, report.errors)) {
        if (!Matches(path, config_.trace_extension)) {
            continue;
        }
        const auto modified = ModifiedAt(path, report.errors);
        if (!modified.has_value() || now - *modified <= max_age) {
            continue;
        }
        const bool removed = std::filesystem::remove(path, ec);
        if (ec) {
            report.errors.push_back({path.string(), "cannot delete: " + ec.message()});
            utils::LogWarn("sweep", "delete failed", {{"path", path.string()}, {"error", ec.message()}});
            continue;
        }
        if (!removed) {
            report.errors.push_back({path.string(), "file vanished before it could be deleted"});
            continue;
        }
        ++report.deleted_count;
        utils::LogInfo("sweep", "deleted trace", {{"file", path.filename().string()}});
    }
}

bool ArtifactSweeper::Matches(const std::filesystem::path& path, const std::string& extension) {
    if (extension.empty()) {
        return true;
    }
    const auto wanted = extension.front() == '.' ? extension : "." + extension;
    return path.extension().string() == wanted;
}

bool ArtifactSweeper::MoveArtifact(const std::filesystem::path& from,
                               const std::filesystem::path& to,
                               std::error_code& ec) {
    ec.clear();
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return true;
    }
    if (ec != std::errc::cross_device_link) {
        return false;
    }
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return false;
    }
    std::filesystem::remove(from, ec);
    return !ec;
}

}  // namespace mailkeep::sweeper
