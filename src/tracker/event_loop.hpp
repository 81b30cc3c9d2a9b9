#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace callsync {

/**
 * Call Event Loop
 *
 * The single logical worker that owns all call/connection mutation.
 * Radio results, unsolicited notifications and user commands are posted
 * from any thread and run strictly one at a time, in posting order.
 *
 * Two ways to drive it:
 *   - start()/stop(): a worker thread drains the queue
 *   - runPending(): the caller's thread drains it (tests, replay tools)
 *
 * A task that throws faults the loop: the exception is logged and kept
 * (see fault()), and no further task runs.
 */
class CallEventLoop {
public:
    using Task = std::function<void()>;

    explicit CallEventLoop(const std::string& name = "calls");
    ~CallEventLoop();

    CallEventLoop(const CallEventLoop&) = delete;
    CallEventLoop& operator=(const CallEventLoop&) = delete;

    // Queue a task. Returns false if the loop has faulted.
    bool post(Task task);

    // Worker thread control
    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Run queued tasks on the calling thread until the queue is empty.
    // Must not be used while the worker thread runs.
    // Returns the number of tasks run; rethrows a task's exception.
    size_t runPending();

    // Block until the worker has drained the queue (or the loop faulted)
    void waitIdle();

    size_t pendingCount() const;
    bool hasFaulted() const;
    std::exception_ptr fault() const;

private:
    std::string name_;

    std::deque<Task> queue_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    bool busy_ = false;

    std::thread worker_;
    std::atomic<bool> running_{false};

    std::exception_ptr fault_;

    void workerLoop();
};

} // namespace callsync
