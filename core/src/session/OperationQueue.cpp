// Worker loop for OperationQueue.
#include "remotix/OperationQueue.hpp"
#include "remotix/Log.hpp"

namespace remotix {

OperationQueue::OperationQueue(std::string name)
    : name_(std::move(name)) {
    worker_ = std::thread([this]() { workerLoop(); });
}

OperationQueue::~OperationQueue() {
    shutdown();
}

bool OperationQueue::push(const Job& job) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_) return false;
        jobs_.push_back(job);
    }
    cv_.notify_one();
    return true;
}

void OperationQueue::workerLoop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [this]() { return closed_ || !jobs_.empty(); });
            // shutdown() drains jobs_ before waking us, so empty means stop
            if (jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        // run() stores any exception in the operation's promise
        job.run();

        std::function<void()> retire;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            retire.swap(retire_);
        }
        if (retire) {
            // Nobody joins us now; retire() may free this queue, so touch
            // no member after it.
            worker_.detach();
            retire();
            return;
        }
    }
}

void OperationQueue::retireAfterCurrent(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mtx_);
    retire_ = std::move(fn);
}

void OperationQueue::shutdown() {
    std::deque<Job> dropped;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!closed_) {
            closed_ = true;
            dropped.swap(jobs_);
        }
    }
    cv_.notify_all();
    if (!dropped.empty()) {
        LOGW("Queue %s closed with %zu pending operation(s)", name_.c_str(), dropped.size());
    }
    for (auto& job : dropped) {
        job.abandon("Connection closed before the operation ran: " + name_);
    }
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

std::size_t OperationQueue::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return jobs_.size();
}

bool OperationQueue::isClosed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
}

} // namespace remotix
