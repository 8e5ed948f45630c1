/**
 * @file UploadWorkers.cpp
 * @brief Upload thread bookkeeping
 */

#include "landrop/UploadWorkers.h"
#include "landrop/Debug.h"

#include <exception>
#include <utility>

namespace LanDrop {

UploadWorkers::~UploadWorkers() {
    joinAll();
}

void UploadWorkers::launch(std::function<void()> task) {
    reapFinished();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([task = std::move(task), done]() {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("[UploadWorkers] Upload task failed: " << e.what());
        }
        done->store(true, std::memory_order_release);
    });

    std::lock_guard<std::mutex> lock(m_mutex);
    m_workers.push_back(Worker{std::move(thread), std::move(done)});
}

size_t UploadWorkers::reapFinished() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_workers.begin(); it != m_workers.end();) {
            auto next = std::next(it);
            if (it->done->load(std::memory_order_acquire)) {
                finished.splice(finished.end(), m_workers, it);
            }
            it = next;
        }
    }

    // The flag is set as the task's last step; join returns almost at once
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    return finished.size();
}

size_t UploadWorkers::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_workers.size();
}

void UploadWorkers::joinAll() {
    std::list<Worker> all;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        all.swap(m_workers);
    }
    for (auto& worker : all) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

}  // namespace LanDrop
