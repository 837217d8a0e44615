#pragma once

/**
 * EventBus.hpp
 *
 * Process-wide publish/subscribe bus with JSON payloads. Download
 * lifecycle events are republished here by EventBusObserver under
 * "download.*" names; the CLI listens to them for its output.
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tether::core {

using json = nlohmann::json;
using EventCallback = std::function<void(const json&)>;

class EventBus;

/**
 * Keeps a subscription alive. Unsubscribes when destroyed or reset.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus* bus, std::string event, uint64_t id)
        : m_bus(bus), m_event(std::move(event)), m_id(id) {}

    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept
        : m_bus(other.m_bus), m_event(std::move(other.m_event)), m_id(other.m_id) {
        other.m_bus = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            m_bus = other.m_bus;
            m_event = std::move(other.m_event);
            m_id = other.m_id;
            other.m_bus = nullptr;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    const std::string& event() const { return m_event; }
    bool active() const { return m_bus != nullptr; }

    inline void reset();

private:
    EventBus* m_bus{nullptr};
    std::string m_event;
    uint64_t m_id{0};
};

/**
 * EventBus - named events, any number of subscribers per event
 */
class EventBus {
public:
    static EventBus& instance() {
        static EventBus instance;
        return instance;
    }

    /**
     * @return Handle that must be kept for as long as the callback should
     *         receive events
     */
    [[nodiscard]] Subscription subscribe(const std::string& event, EventCallback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);

        uint64_t id = ++m_lastId;
        m_subscribers[event].push_back({id, std::make_shared<EventCallback>(std::move(callback))});
        return Subscription(this, event, id);
    }

    /**
     * Deliver synchronously on the calling thread. Callbacks run outside
     * the bus lock; a throwing subscriber is logged and skipped.
     */
    void emit(const std::string& event, const json& data = json::object()) {
        std::vector<std::shared_ptr<EventCallback>> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_subscribers.find(event);
            if (it == m_subscribers.end()) return;

            for (const auto& entry : it->second) {
                callbacks.push_back(entry.callback);
            }
        }

        for (const auto& callback : callbacks) {
            try {
                (*callback)(data);
            } catch (const std::exception& e) {
                LOG_ERROR("Subscriber of '{}' threw: {}", event, e.what());
            }
        }
    }

    size_t subscriberCount(const std::string& event) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_subscribers.find(event);
        return it == m_subscribers.end() ? 0 : it->second.size();
    }

private:
    friend class Subscription;

    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void remove(const std::string& event, uint64_t id) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_subscribers.find(event);
        if (it == m_subscribers.end()) return;

        auto& entries = it->second;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                          [id](const Entry& entry) { return entry.id == id; }),
                      entries.end());

        if (entries.empty()) {
            m_subscribers.erase(it);
        }
    }

private:
    struct Entry {
        uint64_t id;
        std::shared_ptr<EventCallback> callback;
    };

    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<Entry>> m_subscribers;
    uint64_t m_lastId{0};
};

inline void Subscription::reset() {
    if (m_bus) {
        m_bus->remove(m_event, m_id);
        m_bus = nullptr;
    }
}

} // namespace tether::core
