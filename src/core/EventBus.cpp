/**
 * EventBus.cpp
 */

#include "EventBus.hpp"
#include "Logger.hpp"

namespace heal::core {

SubscriptionPtr EventBus::subscribe(const std::string& event, EventCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    uint64_t id = m_nextId++;
    auto subscription = std::make_shared<Subscription>(id, event);
    
    m_subscribers[event].push_back({id, std::move(callback), subscription});
    
    return subscription;
}

SubscriptionPtr EventBus::once(const std::string& event, EventCallback callback) {
    auto subscription = std::make_shared<Subscription>(m_nextId++, event);
    std::weak_ptr<Subscription> weak = subscription;
    
    auto wrappedCallback = [this, weak, callback = std::move(callback)](const json& data) {
        auto self = weak.lock();
        if (!self || !self->isActive()) {
            return;
        }
        self->cancel();
        callback(data);
        unsubscribe(self);
    };
    
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers[event].push_back({subscription->getId(), std::move(wrappedCallback), subscription});
    }
    
    return subscription;
}

void EventBus::unsubscribe(const SubscriptionPtr& subscription) {
    if (!subscription) return;
    
    subscription->cancel();
    
    std::lock_guard<std::mutex> lock(m_mutex);
    
    auto it = m_subscribers.find(subscription->getEvent());
    if (it == m_subscribers.end()) return;
    
    auto& subscribers = it->second;
    subscribers.erase(
        std::remove_if(subscribers.begin(), subscribers.end(),
            [id = subscription->getId()](const SubscriberEntry& entry) {
                return entry.id == id;
            }),
        subscribers.end()
    );
}

void EventBus::emit(const std::string& event, const json& data) {
    std::vector<std::pair<SubscriptionPtr, EventCallback>> callbacks;
    
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        auto it = m_subscribers.find(event);
        if (it != m_subscribers.end()) {
            for (const auto& entry : it->second) {
                if (entry.subscription->isActive()) {
                    callbacks.emplace_back(entry.subscription, entry.callback);
                }
            }
        }
    }
    
    // Call callbacks outside of lock
    for (const auto& [subscription, callback] : callbacks) {
        if (!subscription->isActive()) {
            continue;
        }
        try {
            callback(data);
        } catch (const std::exception& e) {
            HEAL_LOG_ERROR("Subscriber of '{}' threw: {}", event, e.what());
        }
    }
}

size_t EventBus::getSubscriberCount(const std::string& event) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_subscribers.find(event);
    return it != m_subscribers.end() ? it->second.size() : 0;
}

} // namespace heal::core
