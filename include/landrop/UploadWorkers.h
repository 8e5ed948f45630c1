/**
 * @file UploadWorkers.h
 * @brief Owns the threads that push confirmed files to receivers
 */

#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace LanDrop {

/**
 * @class UploadWorkers
 * @brief Set of joinable worker threads that reaps the finished ones
 *
 * Each launch() first joins and drops workers whose task has returned, so a
 * long-running node holds only the uploads still in flight.
 */
class UploadWorkers {
public:
    UploadWorkers() = default;
    UploadWorkers(const UploadWorkers&) = delete;
    UploadWorkers& operator=(const UploadWorkers&) = delete;
    ~UploadWorkers();

    void launch(std::function<void()> task);

    /**
     * @return Number of finished workers joined
     */
    size_t reapFinished();

    /**
     * @brief Workers not yet reaped, finished or not
     */
    size_t size() const;

    /**
     * @brief Wait for every worker; called on shutdown
     */
    void joinAll();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex m_mutex;
    std::list<Worker> m_workers;
};

}  // namespace LanDrop
