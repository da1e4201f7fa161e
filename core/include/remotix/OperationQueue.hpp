// Per-connection FIFO executor: one worker thread runs queued operations
// strictly one after another, so a non-reentrant transport never sees two
// overlapping calls.
#pragma once
#include "Errors.hpp"
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace remotix {

class OperationQueue {
public:
    explicit OperationQueue(std::string name);
    ~OperationQueue();

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    // Schedule fn() after every previously enqueued operation has settled.
    // The future carries fn's own value or exception. A failing operation
    // does not stop the worker.
    template <typename Fn>
    auto enqueue(Fn fn) -> std::future<std::invoke_result_t<Fn&>> {
        using R = std::invoke_result_t<Fn&>;
        auto promise = std::make_shared<std::promise<R>>();
        std::future<R> fut = promise->get_future();

        Job job;
        job.run = [promise, fn = std::move(fn)]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    fn();
                    promise->set_value();
                } else {
                    promise->set_value(fn());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        };
        job.abandon = [promise](const std::string& why) {
            promise->set_exception(std::make_exception_ptr(ConnectionClosedError(why)));
        };

        if (!push(job)) job.abandon("Connection closed: " + name_);
        return fut;
    }

    // Stop accepting work, fail queued operations that have not started,
    // wait for the running one and join the worker. Idempotent.
    // From the worker itself the join is skipped; pair it with
    // retireAfterCurrent() before the queue is released.
    void shutdown();

    // True when called from inside one of this queue's operations.
    bool onWorkerThread() const { return worker_.get_id() == std::this_thread::get_id(); }

    // Only from a running operation: once it returns, the worker detaches
    // and runs fn as its last act. fn may destroy this queue.
    void retireAfterCurrent(std::function<void()> fn);

    // Queued operations not yet started.
    std::size_t pending() const;
    bool isClosed() const;
    const std::string& name() const { return name_; }

private:
    struct Job {
        std::function<void()> run;
        std::function<void(const std::string&)> abandon;
    };

    bool push(const Job& job);
    void workerLoop();

    const std::string name_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool closed_ = false;
    std::function<void()> retire_;
    std::thread worker_;
};

} // namespace remotix
