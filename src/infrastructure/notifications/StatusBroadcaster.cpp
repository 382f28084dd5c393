#include "infrastructure/notifications/StatusBroadcaster.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hostwatch::infra {

void StatusBroadcaster::publish(const std::string& channel, const core::HostStatusChange& change) {
    std::vector<Callback> callbacks;
    {
        std::lock_guard lock(mutex_);
        for (const auto& subscription : subscriptions_) {
            if (subscription.channel == channel) {
                callbacks.push_back(subscription.callback);
            }
        }
    }

    if (callbacks.empty()) {
        spdlog::debug("No subscribers on channel {}", channel);
        return;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(channel, change);
        } catch (const std::exception& e) {
            spdlog::error("Subscriber on channel {} failed for {}: {}", channel, change.toString(),
                          e.what());
        }
    }
}

StatusBroadcaster::SubscriptionId StatusBroadcaster::subscribe(const std::string& channel,
                                                               Callback callback) {
    std::lock_guard lock(mutex_);
    SubscriptionId id = nextId_++;
    subscriptions_.push_back({id, channel, std::move(callback)});
    spdlog::debug("Subscription {} added on channel {}", id, channel);
    return id;
}

bool StatusBroadcaster::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

void StatusBroadcaster::unsubscribeAll() {
    std::lock_guard lock(mutex_);
    subscriptions_.clear();
}

size_t StatusBroadcaster::subscriberCount(const std::string& channel) const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(
        std::count_if(subscriptions_.begin(), subscriptions_.end(),
                       [&channel](const Subscription& s) { return s.channel == channel; }));
}

} // namespace hostwatch::infra
