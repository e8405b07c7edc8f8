// File: src/engine/correlation_update_worker.cpp
#include "engine/correlation_update_worker.hpp"
#include "core/logging.hpp"
#include <stdexcept>

namespace stocklens {

namespace {
constexpr const char* kComponent = "CorrelationUpdateWorker";
}

CorrelationUpdateWorker::CorrelationUpdateWorker(Handler handler)
    : handler_(std::move(handler)) {
    if (!handler_) {
        throw std::invalid_argument("CorrelationUpdateWorker requires a handler");
    }
    thread_ = std::thread([this] { WorkerLoop(); });
}

CorrelationUpdateWorker::~CorrelationUpdateWorker() {
    Stop();
}

bool CorrelationUpdateWorker::Submit(ItemID item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            LogWarn(kComponent, "Worker stopped, dropping refresh for item " + item.ToString());
            return false;
        }
        queue_.push(item);
    }
    work_available_.notify_one();
    return true;
}

void CorrelationUpdateWorker::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void CorrelationUpdateWorker::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

size_t CorrelationUpdateWorker::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void CorrelationUpdateWorker::WorkerLoop() {
    while (true) {
        ItemID item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                // stopping_ and fully drained
                return;
            }
            item = queue_.front();
            queue_.pop();
            busy_ = true;
        }

        try {
            LogInfo(kComponent, "Updating correlations for item " + item.ToString());
            handler_(item);
            processed_.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            LogError(kComponent, "Failed to update correlations for item " + item.ToString() +
                                 ": " + e.what());
        } catch (...) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            LogError(kComponent, "Failed to update correlations for item " + item.ToString() +
                                 ": unknown exception");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_.notify_all();
    }
}

} // namespace stocklens
