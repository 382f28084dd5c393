#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>

namespace hostwatch::infra {

namespace {

// Returns the value if it is at least minimum, otherwise logs and returns the fallback.
int atLeast(const char* key, int value, int minimum, int fallback) {
    if (value < minimum) {
        spdlog::warn("Invalid value {} for {}, using {}", value, key, fallback);
        return fallback;
    }
    return value;
}

std::optional<int> parsePositive(const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < 1) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool isLogLevel(const std::string& level) {
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        config_ = AppConfig{};
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
        fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return static_cast<bool>(file);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

bool ConfigManager::set(const std::string& key, const std::string& value) {
    if (key == "socket-timeout" || key == "max-attempts" || key == "interval") {
        auto number = parsePositive(value);
        if (!number) {
            spdlog::error("{} must be a positive integer, got '{}'", key, value);
            return false;
        }

        if (key == "socket-timeout") {
            config_.socketTimeoutMs = *number;
        } else if (key == "max-attempts") {
            config_.maxAttempts = *number;
        } else {
            config_.checkIntervalSeconds = *number;
        }
    } else if (key == "channel") {
        if (value.empty()) {
            spdlog::error("channel must not be empty");
            return false;
        }
        config_.notificationChannel = value;
    } else if (key == "log-level") {
        if (!isLogLevel(value)) {
            spdlog::error("Unknown log level '{}'", value);
            return false;
        }
        config_.logLevel = value;
    } else {
        spdlog::error("Unknown setting '{}'", key);
        return false;
    }

    return save();
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Monitoring
    j["monitoring"]["socket_timeout_ms"] = config_.socketTimeoutMs;
    j["monitoring"]["max_attempts"] = config_.maxAttempts;
    j["monitoring"]["notification_channel"] = config_.notificationChannel;
    j["monitoring"]["check_interval_seconds"] = config_.checkIntervalSeconds;
    j["monitoring"]["lock_wait_ms"] = config_.lockWaitMs;

    // Logging
    j["logging"]["level"] = config_.logLevel;

    // Webhooks
    j["webhooks"]["enabled"] = config_.webhooksEnabled;
    j["webhooks"]["urls"] = config_.webhookUrls;
    j["webhooks"]["timeout_ms"] = config_.webhookTimeoutMs;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig defaults;
    config_ = defaults;

    // Monitoring
    if (j.contains("monitoring")) {
        const auto& m = j["monitoring"];
        config_.socketTimeoutMs = atLeast("socket_timeout_ms",
                                          m.value("socket_timeout_ms", defaults.socketTimeoutMs),
                                          1, defaults.socketTimeoutMs);
        config_.maxAttempts = atLeast("max_attempts", m.value("max_attempts", defaults.maxAttempts),
                                      1, defaults.maxAttempts);
        config_.notificationChannel =
            m.value("notification_channel", defaults.notificationChannel);
        if (config_.notificationChannel.empty()) {
            spdlog::warn("Empty notification_channel, using {}", defaults.notificationChannel);
            config_.notificationChannel = defaults.notificationChannel;
        }
        config_.checkIntervalSeconds =
            atLeast("check_interval_seconds",
                    m.value("check_interval_seconds", defaults.checkIntervalSeconds), 1,
                    defaults.checkIntervalSeconds);
        config_.lockWaitMs = atLeast("lock_wait_ms", m.value("lock_wait_ms", defaults.lockWaitMs),
                                     0, defaults.lockWaitMs);
    }

    // Logging
    if (j.contains("logging")) {
        config_.logLevel = j["logging"].value("level", defaults.logLevel);
        if (!isLogLevel(config_.logLevel)) {
            spdlog::warn("Unknown log level '{}', using {}", config_.logLevel, defaults.logLevel);
            config_.logLevel = defaults.logLevel;
        }
    }

    // Webhooks
    if (j.contains("webhooks")) {
        const auto& wh = j["webhooks"];
        config_.webhooksEnabled = wh.value("enabled", defaults.webhooksEnabled);
        config_.webhookUrls = wh.value("urls", std::vector<std::string>{});
        config_.webhookTimeoutMs = atLeast("timeout_ms",
                                           wh.value("timeout_ms", defaults.webhookTimeoutMs), 1,
                                           defaults.webhookTimeoutMs);
    }
}

} // namespace hostwatch::infra
