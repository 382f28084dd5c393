#pragma once

#include "core/services/IStatusChangeSink.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hostwatch::infra {

/**
 * @brief In-process publish/subscribe hub for status change events.
 *
 * Subscribers register for one channel and receive every event published on
 * it, in publish order, on the publishing thread. A subscriber that throws is
 * logged and does not affect the other subscribers or the publisher.
 */
class StatusBroadcaster : public core::IStatusChangeSink {
public:
    using Callback = std::function<void(const std::string& channel,
                                        const core::HostStatusChange& change)>;
    using SubscriptionId = uint64_t;

    /**
     * @brief Delivers the change to every subscriber of the channel.
     * @param channel Channel the event is addressed to.
     * @param change The status transition.
     */
    void publish(const std::string& channel, const core::HostStatusChange& change) override;

    /**
     * @brief Registers a callback for a channel.
     * @param channel Channel to listen on.
     * @param callback Function invoked for every event on the channel.
     * @return Identifier for unsubscribe().
     */
    SubscriptionId subscribe(const std::string& channel, Callback callback);

    /**
     * @brief Removes one subscription.
     * @return True if the subscription existed.
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Removes all subscriptions.
     */
    void unsubscribeAll();

    size_t subscriberCount(const std::string& channel) const;

private:
    struct Subscription {
        SubscriptionId id;
        std::string channel;
        Callback callback;
    };

    std::vector<Subscription> subscriptions_;
    SubscriptionId nextId_{1};
    mutable std::mutex mutex_;
};

} // namespace hostwatch::infra
