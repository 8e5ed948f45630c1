/**
 * @file EventQueue.cpp
 */

#include "landrop/EventQueue.h"

namespace LanDrop {

bool EventQueue::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }
        if (std::holds_alternative<PeersChangedEvent>(event) && !m_events.empty()
            && std::holds_alternative<PeersChangedEvent>(m_events.back())) {
            m_events.back() = std::move(event);
            return true;
        }
        m_events.push_back(std::move(event));
    }
    m_cv.notify_one();
    return true;
}

std::optional<Event> EventQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_events.empty() || m_closed; });
    if (m_events.empty()) {
        return std::nullopt;
    }
    Event event = std::move(m_events.front());
    m_events.pop_front();
    return event;
}

std::optional<Event> EventQueue::tryPop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_events.empty()) {
        return std::nullopt;
    }
    Event event = std::move(m_events.front());
    m_events.pop_front();
    return event;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool EventQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

}  // namespace LanDrop
