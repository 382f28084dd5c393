#pragma once

#include "core/types/HostStatusChange.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/HttpClient.hpp"
#include "infrastructure/notifications/StatusBroadcaster.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hostwatch::infra {

/**
 * @brief Forwards status change events to HTTP webhooks.
 *
 * Subscribes to one broadcaster channel and POSTs every event as JSON to each
 * configured URL. Delivery is a single attempt per URL; failures are logged
 * and never reach the check cycle.
 */
class WebhookNotifier {
public:
    /**
     * @brief Constructs a WebhookNotifier.
     * @param broadcaster Broadcaster to subscribe to.
     * @param urls Webhook http or https endpoints; malformed ones are dropped with a warning.
     * @param timeout Connect and read timeout per request.
     */
    WebhookNotifier(std::shared_ptr<StatusBroadcaster> broadcaster, std::vector<std::string> urls,
                    std::chrono::milliseconds timeout);

    /**
     * @brief Unsubscribes from the broadcaster.
     */
    ~WebhookNotifier();

    WebhookNotifier(const WebhookNotifier&) = delete;
    WebhookNotifier& operator=(const WebhookNotifier&) = delete;

    /**
     * @brief Starts forwarding the events of a channel. Replaces any previous channel.
     */
    void attach(const std::string& channel);

    /**
     * @brief Stops forwarding events.
     */
    void detach();

    /**
     * @brief Applies the webhook settings of a freshly loaded configuration.
     *
     * Detaches when webhooks are disabled. Otherwise takes over the URLs and
     * timeout and attaches to the notification channel if it changed.
     */
    void configure(const AppConfig& config);

    /// Channel currently forwarded, if attached.
    const std::optional<std::string>& channel() const { return channel_; }

    /**
     * @brief POSTs one event to every webhook.
     * @return Number of webhooks that answered with a 2xx status.
     */
    size_t deliver(const std::string& channel, const core::HostStatusChange& change);

    const std::vector<std::string>& urls() const { return urls_; }

private:
    void setUrls(const std::vector<std::string>& urls);

    std::shared_ptr<StatusBroadcaster> broadcaster_;
    std::vector<std::string> configuredUrls_;
    std::vector<std::string> urls_;
    std::chrono::milliseconds timeout_;
    HttpClient httpClient_;
    std::optional<StatusBroadcaster::SubscriptionId> subscription_;
    std::optional<std::string> channel_;
};

} // namespace hostwatch::infra
