#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "report/usage_reporter.hpp"
#include "sweeper/artifact_sweeper.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCorruptStore = 2;

void PrintUsage() {
    std::cout << "Usage: mailkeep [--config <path>] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  report-usage [--force-cleanup]  show store and artifact usage\n"
              << "  sweep-artifacts                 archive old outputs, delete old traces\n"
              << "  policies                        show the effective retention settings\n";
}

struct CommandLine {
    std::optional<std::filesystem::path> config_path;
    std::string command;
    bool force_cleanup = false;
    std::vector<std::string> unknown;
};

std::optional<CommandLine> ParseArgs(int argc, char** argv) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "[mailkeep] --config needs a path" << std::endl;
                return std::nullopt;
            }
            cli.config_path = argv[++i];
        } else if (arg == "--force-cleanup") {
            cli.force_cleanup = true;
        } else if (cli.command.empty() && arg.rfind("--", 0) != 0) {
            cli.command = arg;
        } else {
            cli.unknown.push_back(arg);
        }
    }
    return cli;
}

void ApplyLogging(const mailkeep::config::Config& config) {
    mailkeep::utils::LogConfig log_config;
    if (const auto level = mailkeep::utils::ParseLogLevel(config.logging.level)) {
        log_config.min_level = *level;
    }
    mailkeep::utils::SetLogConfig(log_config);
}

int RunReportUsage(const mailkeep::config::Config& config, bool force_cleanup) {
    mailkeep::report::UsageReporter reporter(config);
    const auto report = reporter.Report(force_cleanup);
    std::cout << mailkeep::report::FormatReport(report, config) << std::flush;
    return kExitOk;
}

int RunSweep(const mailkeep::config::Config& config) {
    mailkeep::sweeper::ArtifactSweeper sweeper(
        mailkeep::config::OutputsPath(config),
        mailkeep::config::TracesPath(config),
        config.sweeper);
    const auto report = sweeper.Sweep();
    std::cout << "Archived outputs: " << report.archived_count << "\n"
              << "Deleted traces:   " << report.deleted_count << "\n";
    if (report.Ok()) {
        return kExitOk;
    }
    std::cout << "Errors:           " << report.errors.size() << "\n";
    for (const auto& error : report.errors) {
        std::cout << "  " << error.path << ": " << error.reason << "\n";
    }
    return kExitFailure;
}

}  // namespace

int main(int argc, char** argv) {
    const auto cli = ParseArgs(argc, argv);
    if (!cli.has_value() || cli->command.empty()) {
        PrintUsage();
        return kExitFailure;
    }
    if (!cli->unknown.empty()) {
        std::cerr << "[mailkeep] unexpected argument: " << cli->unknown.front() << std::endl;
        PrintUsage();
        return kExitFailure;
    }
    if (cli->force_cleanup && cli->command != "report-usage") {
        std::cerr << "[mailkeep] --force-cleanup only applies to report-usage" << std::endl;
        PrintUsage();
        return kExitFailure;
    }

    const auto config = cli->config_path.has_value()
        ? mailkeep::config::LoadConfig(*cli->config_path)
        : mailkeep::config::LoadConfig();
    ApplyLogging(config);

    try {
        if (cli->command == "report-usage") {
            return RunReportUsage(config, cli->force_cleanup);
        }
        if (cli->command == "sweep-artifacts") {
            return RunSweep(config);
        }
        if (cli->command == "policies") {
            std::cout << mailkeep::report::FormatPolicies(config) << std::flush;
            return kExitOk;
        }
    } catch (const mailkeep::utils::CorruptStoreError& ex) {
        std::cerr << "[mailkeep] error: " << ex.what() << std::endl;
        return kExitCorruptStore;
    } catch (const std::exception& ex) {
        std::cerr << "[mailkeep] error: " << ex.what() << std::endl;
        return kExitFailure;
    }

    std::cerr << "[mailkeep] unknown command: " << cli->command << std::endl;
    PrintUsage();
    return kExitFailure;
}
