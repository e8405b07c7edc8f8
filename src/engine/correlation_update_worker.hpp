// File: src/engine/correlation_update_worker.hpp
#pragma once

#include "core/types.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace stocklens {

/// CorrelationUpdateWorker: Background refresh of per-item correlations
///
/// One worker thread drains a FIFO of item ids and runs the handler for
/// each. Submit() never blocks on the handler, so a consumption write is not
/// slowed down by the correlation sweep it triggers. Handler failures are
/// logged and counted, never propagated to the submitter.
///
/// Stop() processes everything already queued before joining the thread.
class CorrelationUpdateWorker {
public:
    using Handler = std::function<void(ItemID)>;

    /// Start the worker thread
    explicit CorrelationUpdateWorker(Handler handler);

    /// Stops the worker (draining the queue)
    ~CorrelationUpdateWorker();

    CorrelationUpdateWorker(const CorrelationUpdateWorker&) = delete;
    CorrelationUpdateWorker& operator=(const CorrelationUpdateWorker&) = delete;

    /// Queue a refresh for an item
    /// @return false if the worker has been stopped (the request is dropped)
    bool Submit(ItemID item);

    /// Block until the queue is empty and no handler is running
    void WaitIdle();

    /// Drain the queue and join the worker thread; idempotent
    void Stop();

    size_t PendingCount() const;

    uint64_t ProcessedCount() const { return processed_.load(std::memory_order_relaxed); }
    uint64_t FailedCount() const { return failed_.load(std::memory_order_relaxed); }

private:
    Handler handler_;

    std::queue<ItemID> queue_;
    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;

    bool stopping_{false};
    bool busy_{false};

    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> failed_{0};

    std::thread thread_;

    void WorkerLoop();
};

} // namespace stocklens
