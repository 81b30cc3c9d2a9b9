#include "event_loop.hpp"
#include "callsync/logging.hpp"

namespace callsync {

CallEventLoop::CallEventLoop(const std::string& name)
    : name_(name)
{
}

CallEventLoop::~CallEventLoop() {
    stop();
}

bool CallEventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fault_) {
            LOG_LOOP(WARN, "[%s] Dropping task, loop has faulted", name_.c_str());
            return false;
        }
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
    return true;
}

void CallEventLoop::start() {
    if (running_) return;

    running_ = true;
    worker_ = std::thread(&CallEventLoop::workerLoop, this);
    LOG_LOOP(INFO, "[%s] Worker thread started", name_.c_str());
}

void CallEventLoop::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    work_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    idle_cv_.notify_all();
    LOG_LOOP(INFO, "[%s] Worker thread stopped", name_.c_str());
}

void CallEventLoop::workerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });

            if (!running_ || fault_) {
                break;
            }

            task = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_LOOP(ERROR, "[%s] Task failed, stopping: %s", name_.c_str(), e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            fault_ = std::current_exception();
            queue_.clear();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
            if (fault_) {
                break;
            }
        }
    }

    LOG_LOOP(DEBUG, "[%s] Worker loop exiting", name_.c_str());
}

size_t CallEventLoop::runPending() {
    size_t count = 0;

    while (true) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fault_ || queue_.empty()) {
                break;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_LOOP(ERROR, "[%s] Task failed, stopping: %s", name_.c_str(), e.what());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                fault_ = std::current_exception();
                queue_.clear();
            }
            throw;
        }
        count++;
    }

    LOG_LOOP(TRACE, "[%s] Ran %zu tasks", name_.c_str(), count);
    return count;
}

void CallEventLoop::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] {
        return fault_ || !running_ || (queue_.empty() && !busy_);
    });
}

size_t CallEventLoop::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool CallEventLoop::hasFaulted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(fault_);
}

std::exception_ptr CallEventLoop::fault() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fault_;
}

} // namespace callsync
