#pragma once

#include "uabridge/utilities/blocking_queue.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace uabridge::bridge {

/**
 * @brief Fixed set of threads running submitted tasks
 *
 * Shutdown() refuses new work, runs everything already queued, and joins.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// False once the pool is shutting down.
    bool Submit(Task task);

    void Shutdown();

    [[nodiscard]] size_t ThreadCount() const noexcept { return threads_.size(); }

private:
    void Run();

    utilities::BlockingQueue<Task> tasks_;
    std::vector<std::thread> threads_;
    std::mutex shutdown_lock_;
};

/**
 * @brief Serial executor on top of a WorkerPool
 *
 * Tasks posted to one strand run one at a time, in posting order, on
 * whichever pool thread picks the strand up. A strand occupies at most one
 * thread at a time and yields it after `batch_size` tasks so that busy
 * channels do not starve quiet ones.
 */
class Strand : public std::enable_shared_from_this<Strand> {
public:
    static std::shared_ptr<Strand> Create(WorkerPool& pool, size_t batch_size);

    void Post(WorkerPool::Task task);

    [[nodiscard]] size_t Pending() const;

private:
    Strand(WorkerPool& pool, size_t batch_size);

    void Drain();

    WorkerPool& pool_;
    size_t batch_size_;
    mutable std::mutex lock_;
    std::deque<WorkerPool::Task> pending_;
    bool scheduled_ = false;
};

}
