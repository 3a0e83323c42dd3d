#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace canvascore {

/// Interface for task execution strategies
/// Lets tests run persistence work inline while the application uses a worker thread
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    /// Submit a task for execution
    /// @return false if the executor no longer accepts work
    virtual bool submit(std::function<void()> task) = 0;

    /// Stop accepting work, finish everything already queued, then return
    virtual void shutdown() = 0;

    /// Check if executor is running
    virtual bool isRunning() const = 0;
};

/// Single worker thread draining a FIFO queue.
/// Tasks run strictly in submission order, which keeps per-entity writes
/// in the order they were flushed.
class SerialTaskExecutor : public ITaskExecutor {
public:
    SerialTaskExecutor()
        : worker_([this] { run(); }) {
    }

    ~SerialTaskExecutor() override {
        shutdown();
    }

    // Non-copyable
    SerialTaskExecutor(const SerialTaskExecutor&) = delete;
    SerialTaskExecutor& operator=(const SerialTaskExecutor&) = delete;

    bool submit(std::function<void()> task) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.load()) {
                return false;
            }
            queue_.push_back(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    void shutdown() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    bool isRunning() const override {
        return running_.load();
    }

private:
    void run() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                // running_ only changes under mutex_, so the wakeup cannot be missed
                cv_.wait(lock, [&] { return !queue_.empty() || !running_.load(); });
                // Queued work is drained even after shutdown
                if (queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop_front();
            }
            task();
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    std::atomic<bool> running_{true};
    std::jthread worker_;
};

/// Runs each task on the calling thread. Used by tests for deterministic ordering.
class InlineTaskExecutor : public ITaskExecutor {
public:
    bool submit(std::function<void()> task) override {
        if (!running_) {
            return false;
        }
        task();
        return true;
    }

    void shutdown() override { running_ = false; }
    bool isRunning() const override { return running_; }

private:
    bool running_ = true;
};

}  // namespace canvascore
