#include "server/EventHub.hpp"

namespace automflow {
namespace server {

uint64_t EventHub::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(m_mutex);
    uint64_t id = m_nextId++;
    m_subscribers.emplace(id, std::move(subscriber));
    return id;
}

void EventHub::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscribers.erase(id);
}

size_t EventHub::subscriberCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscribers.size();
}

std::string EventHub::formatFrame(const std::string& eventType, const std::string& data) {
    return "event: " + eventType + "\ndata: " + data + "\n\n";
}

void EventHub::publish(const engine::ExecutionEvent& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_subscribers.empty()) {
        return;
    }
    std::string frame = formatFrame(engine::eventTypeToString(event.type), event.toJson().dump());
    for (auto& entry : m_subscribers) {
        entry.second(frame);
    }
}

engine::ExecutionCallback EventHub::sink() {
    return [this](const engine::ExecutionEvent& event) { publish(event); };
}

} // namespace server
} // namespace automflow
