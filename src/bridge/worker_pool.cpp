#include "uabridge/bridge/worker_pool.hpp"
#include "uabridge/observability/logging.hpp"

#include <exception>

namespace uabridge::bridge {

using observability::StringField;

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        threads = 1;
    }
    threads_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { Run(); });
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

bool WorkerPool::Submit(Task task) {
    return tasks_.Push(std::move(task));
}

void WorkerPool::Shutdown() {
    std::lock_guard guard(shutdown_lock_);
    tasks_.Close();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::Run() {
    while (auto task = tasks_.Pop()) {
        try {
            (*task)();
        } catch (const std::exception& ex) {
            UABRIDGE_LOG_ERROR("Worker task threw", {StringField("error", ex.what())});
        }
    }
}

std::shared_ptr<Strand> Strand::Create(WorkerPool& pool, const size_t batch_size) {
    return std::shared_ptr<Strand>(new Strand(pool, batch_size));
}

Strand::Strand(WorkerPool& pool, const size_t batch_size)
    : pool_(pool)
    , batch_size_(batch_size == 0 ? 1 : batch_size) {}

void Strand::Post(WorkerPool::Task task) {
    bool schedule = false;
    {
        std::lock_guard lock(lock_);
        pending_.push_back(std::move(task));
        if (!scheduled_) {
            scheduled_ = true;
            schedule = true;
        }
    }
    if (schedule && !pool_.Submit([self = shared_from_this()] { self->Drain(); })) {
        // Pool is draining for shutdown; run here so nothing posted is lost.
        Drain();
    }
}

size_t Strand::Pending() const {
    std::lock_guard lock(lock_);
    return pending_.size();
}

void Strand::Drain() {
    while (true) {
        for (size_t ran = 0; ran < batch_size_; ++ran) {
            WorkerPool::Task task;
            {
                std::lock_guard lock(lock_);
                if (pending_.empty()) {
                    scheduled_ = false;
                    return;
                }
                task = std::move(pending_.front());
                pending_.pop_front();
            }
            try {
                task();
            } catch (const std::exception& ex) {
                UABRIDGE_LOG_ERROR("Strand task threw", {StringField("error", ex.what())});
            }
        }
        if (pool_.Submit([self = shared_from_this()] { self->Drain(); })) {
            return;
        }
    }
}

}
