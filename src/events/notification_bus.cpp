/**
 * @file notification_bus.cpp
 * @brief Asynchronous notification bus implementation
 */

#include <web_tiles/events/notification_bus.h>
#include <web_tiles/constants.h>
#include <exception>
#include <vector>
#include <spdlog/spdlog.h>

namespace web_tiles {

const char* ToString(TileEvent event) {
    switch (event) {
        case TileEvent::REQUESTED:
            return constants::notifications::TILE_REQUESTED;
        case TileEvent::RETRIEVED:
            return constants::notifications::TILE_RETRIEVED;
    }
    return "Unknown";
}

AsyncNotificationBus::AsyncNotificationBus() {
    dispatch_thread_ = std::thread(&AsyncNotificationBus::DispatchThreadMain, this);
    spdlog::debug("Notification bus dispatch thread started");
}

AsyncNotificationBus::~AsyncNotificationBus() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    queue_cv_.notify_all();

    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    spdlog::debug("Notification bus dispatch thread stopped");
}

void AsyncNotificationBus::Publish(TileEvent event, std::uint64_t tile_key) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return;
        }
        queue_.push_back(PendingEvent{event, tile_key});
    }
    queue_cv_.notify_one();
}

AsyncNotificationBus::SubscriptionId AsyncNotificationBus::Subscribe(TileEventCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    const SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

bool AsyncNotificationBus::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.erase(id) > 0;
}

void AsyncNotificationBus::Flush() {
    if (std::this_thread::get_id() == dispatch_thread_.get_id()) {
        // An observer cannot wait for its own delivery to finish
        spdlog::warn("Flush() called from a notification observer, ignoring");
        return;
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && !dispatching_; });
}

std::size_t AsyncNotificationBus::GetPendingCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void AsyncNotificationBus::DispatchThreadMain() {
    while (true) {
        PendingEvent pending{};
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });

            if (queue_.empty()) {
                // stop_ set and nothing left to deliver
                break;
            }
            pending = queue_.front();
            queue_.pop_front();
            dispatching_ = true;
        }

        // Snapshot so observers may (un)subscribe from inside a callback
        std::vector<TileEventCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex_);
            callbacks.reserve(subscribers_.size());
            for (const auto& [id, callback] : subscribers_) {
                callbacks.push_back(callback);
            }
        }

        for (const auto& callback : callbacks) {
            try {
                callback(pending.event, pending.tile_key);
            } catch (const std::exception& e) {
                spdlog::error("Observer of {} for tile key {} threw: {}",
                              ToString(pending.event), pending.tile_key, e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            dispatching_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    idle_cv_.notify_all();
}

} // namespace web_tiles
