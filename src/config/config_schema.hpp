#pragma once

#include <string>

namespace mailkeep::config {

struct StorageConfig {
    std::string data_dir = ".";
    std::string history_file = "email_history_log.json";
    std::string plans_file = "campaign_plans.json";
    std::string outputs_dir = "outputs";
    std::string traces_dir = "traces";
};

struct HistoryRetentionConfig {
    int max_per_group = 50;
    int max_total = 500;
};

struct PlanRetentionConfig {
    int max_active_per_group = 10;
    int archive_after_days = 90;
    int delete_after_days = 365;
};

struct SweeperConfig {
    int archive_days = 30;
    int trace_retention_days = 7;
    // Empty matches every regular file.
    std::string output_extension = ".txt";
    std::string trace_extension = ".json";
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    StorageConfig storage;
    HistoryRetentionConfig history;
    PlanRetentionConfig plans;
    SweeperConfig sweeper;
    LoggingConfig logging;
};

}  // namespace mailkeep::config
