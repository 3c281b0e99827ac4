#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "utils/errors.hpp"
#include "utils/time.hpp"

namespace mailkeep::sweeper {

struct SweepReport {
    std::size_t archived_count = 0;
    std::size_t deleted_count = 0;
    std::vector<utils::ArtifactIOError> errors;

    bool Ok() const { return errors.empty(); }
};

// On-demand pass over artifact directories, driven by file mtimes only.
// Output files older than archive_days move to <outputs>/archive/YYYY-MM/;
// trace files older than trace_retention_days are deleted. A failing file is
// recorded and skipped; re-running after a partial sweep is safe.
class ArtifactSweeper {
public:
    ArtifactSweeper(std::filesystem::path outputs_dir,
                    std::filesystem::path traces_dir,
                    config::SweeperConfig config,
                    utils::Clock clock = utils::SystemClock());

    SweepReport Sweep();

    static std::filesystem::path ArchiveDir(const std::filesystem::path& outputs_dir);

private:
    void ArchiveOutputs(SweepReport& report, utils::TimePoint now);
    void DeleteTraces(SweepReport& report, utils::TimePoint now);
    static bool Matches(const std::filesystem::path& path, const std::string& extension);
    static bool MoveArtifact(const std::filesystem::path& from,
                         const std::filesystem::path& to,
                         std::error_code& ec);

    std::filesystem::path outputs_dir_;
    std::filesystem::path traces_dir_;
    config::SweeperConfig config_;
    utils::Clock clock_;
};

}  // namespace mailkeep::sweeper
