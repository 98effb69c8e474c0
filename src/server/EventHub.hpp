#pragma once

#include "engine/ExecutionEvent.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace automflow {
namespace server {

/**
 * Fan-out of engine events to SSE subscribers
 *
 * Installed as the ExecutionManager event sink. publish() serializes the event
 * once and hands the SSE frame to every subscriber. Subscribers are called
 * with the hub lock held (and possibly the scheduler lock): they must only
 * queue the frame, never block or call back into the hub or the manager.
 */
class EventHub {
public:
    /// Receives a complete SSE frame ("event: ...\ndata: ...\n\n")
    using Subscriber = std::function<void(const std::string& frame)>;

    EventHub() = default;
    EventHub(const EventHub&) = delete;
    EventHub& operator=(const EventHub&) = delete;

    uint64_t subscribe(Subscriber subscriber);
    void unsubscribe(uint64_t id);
    size_t subscriberCount() const;

    void publish(const engine::ExecutionEvent& event);

    /**
     * Event sink suitable for ExecutionManager::setEventSink
     */
    engine::ExecutionCallback sink();

    static std::string formatFrame(const std::string& eventType, const std::string& data);

private:
    mutable std::mutex m_mutex;
    std::map<uint64_t, Subscriber> m_subscribers;
    uint64_t m_nextId = 1;
};

} // namespace server
} // namespace automflow
