#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace feedstore {

// Single worker thread running submitted tasks one at a time in FIFO order.
//
// shutdown() (and the destructor) drains every task submitted before the
// drain finishes, including tasks submitted by the draining tasks
// themselves, then stops the worker. Called from another thread it joins
// the worker. Called from one of the queue's own tasks it drains the
// remaining tasks on the worker right away and detaches it, so a task may
// destroy the object that owns the queue.
class SerialQueue {
public:
    explicit SerialQueue(std::string name);
    ~SerialQueue();

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    // Once the worker has stopped the task runs inline on the calling thread.
    void submit(std::function<void()> task);

    void shutdown();
    bool is_current_thread() const;
    const std::string& name() const { return name_; }

private:
    // Outlives the queue while a detached worker is unwinding
    struct State {
        std::mutex mtx;
        std::condition_variable cv;
        std::deque<std::function<void()>> tasks;
        bool shutdown = false;
        bool stopped = false;
    };

    static void run(std::shared_ptr<State> state);
    void drain_inline();

    std::string name_;
    std::shared_ptr<State> state_;
    std::thread worker_;
};

} // namespace feedstore
