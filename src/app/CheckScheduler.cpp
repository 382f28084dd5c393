#include "app/CheckScheduler.hpp"

#include "app/CycleLock.hpp"

#include <spdlog/spdlog.h>

#include <future>

namespace hostwatch::app {

CheckScheduler::CheckScheduler(infra::AsioContext& context, CycleFunction cycle,
                               std::chrono::seconds interval, std::filesystem::path lockPath,
                               std::chrono::milliseconds lockWait)
    : context_(context), cycle_(std::move(cycle)), interval_(interval),
      lockPath_(std::move(lockPath)), lockWait_(lockWait) {
    timer_ = std::make_unique<asio::steady_timer>(context_.getContext());
}

CheckScheduler::~CheckScheduler() {
    stop();
}

void CheckScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    spdlog::info("Checking hosts every {} seconds", interval_.count());

    context_.post([this]() {
        if (!running_) {
            return;
        }
        runGuarded(std::nullopt);
        scheduleNext();
    });
}

void CheckScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        timer_->cancel();
    }

    // Handlers queued before this point still reference the scheduler.
    auto& io = context_.getContext();
    if (context_.isRunning() && !io.get_executor().running_in_this_thread()) {
        std::promise<void> drained;
        auto done = drained.get_future();
        context_.post([&drained]() { drained.set_value(); });
        done.wait();
    }

    spdlog::debug("Check scheduler stopped after {} cycles", completedCycles_.load());
}

void CheckScheduler::startCheck() {
    post(std::nullopt);
}

void CheckScheduler::startCheck(core::ConnectionType connectionType) {
    post(connectionType);
}

void CheckScheduler::post(std::optional<core::ConnectionType> connectionType) {
    if (!running_) {
        spdlog::warn("Check scheduler is not running, ignoring trigger");
        return;
    }

    context_.post([this, connectionType]() {
        if (running_) {
            runGuarded(connectionType);
        }
    });
}

void CheckScheduler::scheduleNext() {
    std::lock_guard lock(mutex_);
    if (!running_) {
        return;
    }

    timer_->expires_after(interval_);
    timer_->async_wait([this](const asio::error_code& ec) {
        if (ec || !running_) {
            return;
        }

        runGuarded(std::nullopt);
        scheduleNext();
    });

    spdlog::debug("Next check in {} seconds", interval_.count());
}

void CheckScheduler::runGuarded(std::optional<core::ConnectionType> connectionType) {
    try {
        CycleLock lock(lockPath_, lockWait_);
        if (!lock.acquired()) {
            spdlog::warn("Another check cycle is running, skipping this one");
            ++skippedCycles_;
            return;
        }

        cycle_(connectionType);
        ++completedCycles_;
    } catch (const std::exception& e) {
        spdlog::error("Check cycle failed: {}", e.what());
        ++failedCycles_;
    }
}

} // namespace hostwatch::app
