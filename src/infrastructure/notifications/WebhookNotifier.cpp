#include "infrastructure/notifications/WebhookNotifier.hpp"

#include "infrastructure/notifications/StatusChangePayload.hpp"

#include <spdlog/spdlog.h>

namespace hostwatch::infra {

WebhookNotifier::WebhookNotifier(std::shared_ptr<StatusBroadcaster> broadcaster,
                                 std::vector<std::string> urls, std::chrono::milliseconds timeout)
    : broadcaster_(std::move(broadcaster)), timeout_(timeout) {
    setUrls(urls);
}

WebhookNotifier::~WebhookNotifier() {
    detach();
}

void WebhookNotifier::attach(const std::string& channel) {
    detach();
    subscription_ = broadcaster_->subscribe(
        channel, [this](const std::string& ch, const core::HostStatusChange& change) {
            deliver(ch, change);
        });
    channel_ = channel;
    spdlog::info("Forwarding channel {} to {} webhooks", channel, urls_.size());
}

void WebhookNotifier::detach() {
    if (subscription_) {
        broadcaster_->unsubscribe(*subscription_);
        subscription_.reset();
    }
    channel_.reset();
}

void WebhookNotifier::configure(const AppConfig& config) {
    if (!config.webhooksEnabled) {
        if (channel_) {
            spdlog::info("Webhook notifications disabled");
            detach();
        }
        return;
    }

    setUrls(config.webhookUrls);
    timeout_ = std::chrono::milliseconds(config.webhookTimeoutMs);
    if (channel_ != config.notificationChannel) {
        attach(config.notificationChannel);
    }
}

void WebhookNotifier::setUrls(const std::vector<std::string>& urls) {
    if (urls == configuredUrls_) {
        return;
    }

    configuredUrls_ = urls;
    urls_.clear();
    for (const auto& url : urls) {
        if (!HttpClient::parseUrl(url)) {
            spdlog::warn("Ignoring malformed webhook URL: {}", url);
            continue;
        }
        urls_.push_back(url);
    }
}

size_t WebhookNotifier::deliver(const std::string& channel, const core::HostStatusChange& change) {
    if (urls_.empty()) {
        return 0;
    }

    std::string payload = toJson(channel, change).dump();
    std::map<std::string, std::string> headers{{"Content-Type", "application/json"}};

    size_t delivered = 0;
    for (const auto& url : urls_) {
        auto response = httpClient_.post(url, payload, headers, timeout_);
        if (response.success) {
            spdlog::debug("Webhook delivered to {} (status: {})", url, response.statusCode);
            ++delivered;
        } else if (response.completed) {
            spdlog::warn("Webhook {} answered with status {}", url, response.statusCode);
        } else {
            spdlog::warn("Webhook delivery to {} failed: {}", url, response.errorMessage);
        }
    }
    return delivered;
}

} // namespace hostwatch::infra
