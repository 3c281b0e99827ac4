#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <string>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace mailkeep::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

void ApplyPositive(int& target, int value, const char* name) {
    if (value <= 0) {
        utils::LogWarn("config", "ignoring non-positive threshold", {{"key", name}, {"value", std::to_string(value)}});
        return;
    }
    target = value;
}

void ApplyPositiveFromJson(int& target, const nlohmann::json& section, const char* key) {
    if (section.contains(key) && section[key].is_number_integer()) {
        ApplyPositive(target, section[key].get<int>(), key);
    }
}

void ApplyStringFromJson(std::string& target, const nlohmann::json& section, const char* key) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        utils::LogWarn("config", "config root is not an object; using defaults");
        return;
    }

    if (data.contains("storage") && data["storage"].is_object()) {
        const auto& storage = data["storage"];
        ApplyStringFromJson(config.storage.data_dir, storage, "dataDir");
        ApplyStringFromJson(config.storage.history_file, storage, "historyFile");
        ApplyStringFromJson(config.storage.plans_file, storage, "plansFile");
        ApplyStringFromJson(config.storage.outputs_dir, storage, "outputsDir");
        ApplyStringFromJson(config.storage.traces_dir, storage, "tracesDir");
    }

    if (data.contains("history") && data["history"].is_object()) {
        const auto& history = data["history"];
        ApplyPositiveFromJson(config.history.max_per_group, history, "maxPerGroup");
        ApplyPositiveFromJson(config.history.max_total, history, "maxTotal");
    }

    if (data.contains("plans") && data["plans"].is_object()) {
        const auto& plans = data["plans"];
        ApplyPositiveFromJson(config.plans.max_active_per_group, plans, "maxActivePerGroup");
        ApplyPositiveFromJson(config.plans.archive_after_days, plans, "archiveAfterDays");
        ApplyPositiveFromJson(config.plans.delete_after_days, plans, "deleteAfterDays");
    }

    if (data.contains("sweeper") && data["sweeper"].is_object()) {
        const auto& sweeper = data["sweeper"];
        ApplyPositiveFromJson(config.sweeper.archive_days, sweeper, "archiveDays");
        ApplyPositiveFromJson(config.sweeper.trace_retention_days, sweeper, "traceRetentionDays");
        ApplyStringFromJson(config.sweeper.output_extension, sweeper, "outputExtension");
        ApplyStringFromJson(config.sweeper.trace_extension, sweeper, "traceExtension");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyStringFromJson(config.logging.level, data["logging"], "level");
    }
}

void ApplyIntFromEnv(int& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (value.empty()) {
        return;
    }
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        utils::LogWarn("config", "ignoring non-numeric override", {{"key", primary}, {"value", value}});
        return;
    }
    ApplyPositive(target, parsed, primary);
}

void ApplyStringFromEnv(std::string& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void ApplyEnvironment(Config& config) {
    ApplyStringFromEnv(config.storage.data_dir, "MAILKEEP_STORAGE__DATA_DIR", "MAILKEEP_DATA_DIR");
    ApplyStringFromEnv(config.storage.history_file, "MAILKEEP_STORAGE__HISTORY_FILE", "MAILKEEP_HISTORY_FILE");
    ApplyStringFromEnv(config.storage.plans_file, "MAILKEEP_STORAGE__PLANS_FILE", "MAILKEEP_PLANS_FILE");
    ApplyStringFromEnv(config.storage.outputs_dir, "MAILKEEP_STORAGE__OUTPUTS_DIR", "MAILKEEP_OUTPUTS_DIR");
    ApplyStringFromEnv(config.storage.traces_dir, "MAILKEEP_STORAGE__TRACES_DIR", "MAILKEEP_TRACES_DIR");

    ApplyIntFromEnv(config.history.max_per_group,
                    "MAILKEEP_HISTORY__MAX_PER_GROUP", "MAILKEEP_HISTORY_MAX_PER_GROUP");
    ApplyIntFromEnv(config.history.max_total,
                    "MAILKEEP_HISTORY__MAX_TOTAL", "MAILKEEP_HISTORY_MAX_TOTAL");

    ApplyIntFromEnv(config.plans.max_active_per_group,
                    "MAILKEEP_PLANS__MAX_ACTIVE_PER_GROUP", "MAILKEEP_PLANS_MAX_ACTIVE_PER_GROUP");
    ApplyIntFromEnv(config.plans.archive_after_days,
                    "MAILKEEP_PLANS__ARCHIVE_AFTER_DAYS", "MAILKEEP_PLANS_ARCHIVE_AFTER_DAYS");
    ApplyIntFromEnv(config.plans.delete_after_days,
                    "MAILKEEP_PLANS__DELETE_AFTER_DAYS", "MAILKEEP_PLANS_DELETE_AFTER_DAYS");

    ApplyIntFromEnv(config.sweeper.archive_days,
                    "MAILKEEP_SWEEPER__ARCHIVE_DAYS", "MAILKEEP_SWEEPER_ARCHIVE_DAYS");
    ApplyIntFromEnv(config.sweeper.trace_retention_days,
                    "MAILKEEP_SWEEPER__TRACE_RETENTION_DAYS", "MAILKEEP_SWEEPER_TRACE_RETENTION_DAYS");

    ApplyStringFromEnv(config.logging.level, "MAILKEEP_LOGGING__LEVEL", "MAILKEEP_LOG_LEVEL");
}

std::filesystem::path Resolve(const Config& config, const std::string& relative) {
    const std::filesystem::path path(relative);
    if (path.is_absolute()) {
        return path;
    }
    return std::filesystem::path(config.storage.data_dir) / path;
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto explicit_path = GetEnv("MAILKEEP_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".mailkeep" / "config.json";
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            utils::LogWarn("config", "cannot open config file; using defaults", {{"path", config_path.string()}});
        } else {
            try {
                nlohmann::json data;
                input >> data;
                ApplyConfigFromJson(config, data);
            } catch (const nlohmann::json::exception& ex) {
                utils::LogWarn("config", "malformed config file; using defaults",
                               {{"path", config_path.string()}, {"error", ex.what()}});
            }
        }
    }

    ApplyEnvironment(config);

    if (!utils::ParseLogLevel(config.logging.level).has_value()) {
        utils::LogWarn("config", "unknown log level; using info", {{"level", config.logging.level}});
        config.logging.level = "info";
    }
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

std::filesystem::path HistoryStorePath(const Config& config) {
    return Resolve(config, config.storage.history_file);
}

std::filesystem::path PlanStorePath(const Config& config) {
    return Resolve(config, config.storage.plans_file);
}

std::filesystem::path OutputsPath(const Config& config) {
    return Resolve(config, config.storage.outputs_dir);
}

std::filesystem::path TracesPath(const Config& config) {
    return Resolve(config, config.storage.traces_dir);
}

}  // namespace mailkeep::config
