#pragma once

/**
 * EventBus.hpp
 * 
 * Thread-safe event bus for decoupled communication between the download
 * engine and its callers. Publish/subscribe with JSON payloads.
 */

#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace heal::core {

using json = nlohmann::json;
using EventCallback = std::function<void(const json&)>;

/**
 * Event subscription handle
 */
class Subscription {
public:
    Subscription(uint64_t id, const std::string& event)
        : m_id(id), m_event(event), m_active(true) {}
    
    uint64_t getId() const { return m_id; }
    const std::string& getEvent() const { return m_event; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::string m_event;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventBus - Thread-safe publish/subscribe event system
 * 
 * Owned by the application and handed to the components that publish or
 * listen. Callbacks run on the emitting thread, outside the bus lock, so
 * they may subscribe or unsubscribe freely.
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;
    
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    
    /**
     * Subscribe to an event
     * @param event Event name
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(const std::string& event, EventCallback callback);
    
    /**
     * Subscribe to an event once (auto-unsubscribe after first call)
     * @param event Event name
     * @param callback Callback function
     * @return Subscription handle
     */
    SubscriptionPtr once(const std::string& event, EventCallback callback);
    
    /**
     * Unsubscribe from an event
     * @param subscription Subscription handle
     */
    void unsubscribe(const SubscriptionPtr& subscription);
    
    /**
     * Emit an event to every active subscriber
     * @param event Event name
     * @param data Event data
     */
    void emit(const std::string& event, const json& data = json::object());
    
    /**
     * Get subscriber count for event
     * @param event Event name
     * @return Number of subscribers
     */
    size_t getSubscriberCount(const std::string& event) const;
    
private:
    struct SubscriberEntry {
        uint64_t id;
        EventCallback callback;
        SubscriptionPtr subscription;
    };
    
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<SubscriberEntry>> m_subscribers;
    std::atomic<uint64_t> m_nextId{0};
};

} // namespace heal::core
