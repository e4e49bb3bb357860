#pragma once

/**
 * @file notification_bus.h
 * @brief Fire-and-forget tile lifecycle notifications
 *
 * The fetch pipeline publishes "tile requested" right before network
 * activity and "tile retrieved" when a fetch attempt finishes, successful
 * or not. Publishing never blocks on observers.
 */

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace web_tiles {

/**
 * @brief Tile lifecycle events
 */
enum class TileEvent {
    REQUESTED,  ///< Network activity for the tile is about to start
    RETRIEVED   ///< The fetch pipeline finished (success or failure)
};

/**
 * @brief Get the notification name of an event
 */
const char* ToString(TileEvent event);

/**
 * @brief Observer callback: event and the tile's 64-bit key
 */
using TileEventCallback = std::function<void(TileEvent, std::uint64_t)>;

/**
 * @brief Notification bus collaborator
 *
 * Publish() must return without waiting for observers. No delivery
 * guarantee is required.
 */
class NotificationBus {
public:
    virtual ~NotificationBus() = default;

    /**
     * @brief Publish an event
     *
     * @param event Event kind
     * @param tile_key Key from GetTileKey()
     */
    virtual void Publish(TileEvent event, std::uint64_t tile_key) = 0;
};

/**
 * @brief Bus delivering events to subscribers on a dedicated thread
 *
 * Multi-producer queue drained by one dispatch thread, so observers run
 * serially, in publish order, and never on the publishing thread.
 */
class AsyncNotificationBus : public NotificationBus {
public:
    using SubscriptionId = std::uint64_t;

    AsyncNotificationBus();

    /**
     * @brief Destructor
     *
     * Delivers events still queued, then stops the dispatch thread.
     */
    ~AsyncNotificationBus() override;

    // Non-copyable
    AsyncNotificationBus(const AsyncNotificationBus&) = delete;
    AsyncNotificationBus& operator=(const AsyncNotificationBus&) = delete;

    void Publish(TileEvent event, std::uint64_t tile_key) override;

    /**
     * @brief Register an observer
     *
     * @return SubscriptionId Handle for Unsubscribe()
     */
    SubscriptionId Subscribe(TileEventCallback callback);

    /**
     * @brief Remove an observer
     *
     * @return true if the observer was registered
     */
    bool Unsubscribe(SubscriptionId id);

    /**
     * @brief Block until every event published so far has been delivered
     *
     * Returns immediately when called from an observer on the dispatch
     * thread.
     */
    void Flush();

    /**
     * @brief Get events waiting for delivery
     */
    std::size_t GetPendingCount() const;

private:
    struct PendingEvent {
        TileEvent event;
        std::uint64_t tile_key;
    };

    void DispatchThreadMain();

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<PendingEvent> queue_;
    bool dispatching_ = false;
    bool stop_ = false;

    std::mutex subscribers_mutex_;
    std::map<SubscriptionId, TileEventCallback> subscribers_;
    SubscriptionId next_id_ = 1;

    std::thread dispatch_thread_;
};

} // namespace web_tiles
