/**
 * @file EventQueue.h
 * @brief Blocking multi-producer event channel
 */

#pragma once

#include "Events.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace LanDrop {

/**
 * @class EventQueue
 * @brief FIFO of Event values shared between producer threads and one consumer
 *
 * Consecutive PeersChangedEvent values are coalesced: pushing one while the
 * newest queued event is also a PeersChangedEvent replaces that snapshot.
 * After close() pushes are dropped and pop() drains what is left, then
 * returns nullopt immediately.
 */
class EventQueue {
public:
    EventQueue() = default;
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /**
     * @return false if the queue is closed
     */
    bool push(Event event);

    /**
     * @brief Wait up to timeout for an event
     */
    std::optional<Event> pop(std::chrono::milliseconds timeout);

    std::optional<Event> tryPop();

    void close();
    bool isClosed() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Event> m_events;
    bool m_closed = false;
};

}  // namespace LanDrop
