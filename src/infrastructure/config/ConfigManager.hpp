#pragma once

#include "core/types/MonitorConfig.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hostwatch::infra {

/**
 * @brief Application configuration settings.
 *
 * Scalar settings of the monitor, logging and webhook delivery. The monitored
 * hosts themselves live in the database.
 */
struct AppConfig {
    // Monitoring
    int socketTimeoutMs{core::DEFAULT_SOCKET_TIMEOUT_MS};///< Probe connect and read timeout.
    int maxAttempts{core::DEFAULT_MAX_ATTEMPTS};         ///< Probe attempts per host and cycle.
    std::string notificationChannel{core::DEFAULT_NOTIFICATION_CHANNEL}; ///< Channel status changes are published on.
    int checkIntervalSeconds{core::DEFAULT_CHECK_INTERVAL_SECONDS}; ///< Interval between periodic checks.
    int lockWaitMs{5000};                              ///< How long a cycle waits for the cycle lock.

    // Logging
    std::string logLevel{"info"}; ///< Console log level.

    // Webhook notifications
    bool webhooksEnabled{false};          ///< POST status changes to webhooks.
    std::vector<std::string> webhookUrls; ///< Webhook endpoints (http only).
    int webhookTimeoutMs{5000};           ///< Webhook request timeout in milliseconds.
};

/**
 * @brief Manages configuration persistence.
 *
 * Handles loading and saving of the configuration from a JSON file in the
 * data directory, and knows where the other data files live.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified data directory.
     * @param configDir Path to the data directory; created if missing.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, replacing the values in memory.
     *
     * Writes the defaults if the file does not exist. Missing keys take their
     * default value and out-of-range values are replaced by the default.
     *
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    /**
     * @brief Changes one setting from its command-line form and saves it.
     *
     * Keys: socket-timeout, max-attempts, channel, interval, log-level.
     *
     * @param key Setting name.
     * @param value New value.
     * @return True if the value was valid and saved.
     */
    bool set(const std::string& key, const std::string& value);

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }
    std::filesystem::path databasePath() const { return configDir_ / "hostwatch.db"; }
    std::filesystem::path lockPath() const { return configDir_ / "hostwatch.lock"; }
    std::filesystem::path logPath() const { return configDir_ / "hostwatch.log"; }
    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace hostwatch::infra
