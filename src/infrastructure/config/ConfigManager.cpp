#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace devsweep::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        config_ = fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson(config_);

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "devsweep.log";
}

nlohmann::json ConfigManager::toJson(const AppConfig& config) {
    nlohmann::json j;
    const auto& scan = config.scan;

    // Scan
    j["scan"]["start_ip"] = scan.startIp;
    j["scan"]["end_ip"] = scan.endIp;
    j["scan"]["ports"] = scan.portSpec;
    j["scan"]["threads"] = scan.threads;
    j["scan"]["timeout_seconds"] = scan.timeoutSeconds;
    j["scan"]["profile"] = scan.profile ? nlohmann::json(*scan.profile) : nlohmann::json();
    j["scan"]["max_targets"] =
        scan.maxTargets ? nlohmann::json(*scan.maxTargets) : nlohmann::json();

    // Services
    j["services"]["adb"] = scan.flags.scanAdb;
    j["services"]["ssh"] = scan.flags.scanSsh;
    j["services"]["telnet"] = scan.flags.scanTelnet;

    // Options
    j["options"]["skip_ping"] = scan.flags.skipPing;

    // Export
    j["export"]["directory"] = config.exportDirectory;
    j["export"]["json"] = config.exportJson;
    j["export"]["csv"] = config.exportCsv;
    j["export"]["all"] = config.exportAll;

    // Logging
    j["logging"]["level"] = config.logLevel;

    return j;
}

AppConfig ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig config;
    auto& scan = config.scan;
    const core::ScanConfig defaults;

    // Scan
    if (j.contains("scan")) {
        const auto& s = j["scan"];
        scan.startIp = s.value("start_ip", defaults.startIp);
        scan.endIp = s.value("end_ip", defaults.endIp);
        scan.portSpec = s.value("ports", defaults.portSpec);
        scan.threads = s.value("threads", defaults.threads);
        scan.timeoutSeconds = s.value("timeout_seconds", defaults.timeoutSeconds);
        if (s.contains("profile") && s["profile"].is_string()) {
            scan.profile = s["profile"].get<std::string>();
        }
        if (s.contains("max_targets") && s["max_targets"].is_number_unsigned()) {
            scan.maxTargets = s["max_targets"].get<uint64_t>();
        }
    }

    // Services
    if (j.contains("services")) {
        const auto& sv = j["services"];
        scan.flags.scanAdb = sv.value("adb", true);
        scan.flags.scanSsh = sv.value("ssh", true);
        scan.flags.scanTelnet = sv.value("telnet", true);
    }

    // Options
    if (j.contains("options")) {
        scan.flags.skipPing = j["options"].value("skip_ping", false);
    }

    // Export
    if (j.contains("export")) {
        const auto& e = j["export"];
        config.exportDirectory = e.value("directory", std::string{"."});
        config.exportJson = e.value("json", true);
        config.exportCsv = e.value("csv", true);
        config.exportAll = e.value("all", false);
    }

    // Logging
    if (j.contains("logging")) {
        config.logLevel = j["logging"].value("level", std::string{"info"});
    }

    return config;
}

} // namespace devsweep::infra
