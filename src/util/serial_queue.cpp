#include <feedstore/serial_queue.hpp>
#include <feedstore/log.hpp>
#include <utility>

namespace feedstore {

SerialQueue::SerialQueue(std::string name)
    : name_(std::move(name)),
      state_(std::make_shared<State>()) {
    worker_ = std::thread(&SerialQueue::run, state_);
}

SerialQueue::~SerialQueue() {
    shutdown();
}

void SerialQueue::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (!state_->stopped) {
            state_->tasks.emplace_back(std::move(task));
            state_->cv.notify_one();
            return;
        }
    }
    log::debug("queue %s is stopped, running task inline", name_.c_str());
    task();
}

void SerialQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (state_->shutdown) return;
        state_->shutdown = true;
    }
    state_->cv.notify_all();

    if (!worker_.joinable()) return;
    if (is_current_thread()) {
        // The running task is tearing the queue down; run() returns as soon
        // as that task does and never touches this object again.
        drain_inline();
        worker_.detach();
    } else {
        worker_.join();
    }
}

bool SerialQueue::is_current_thread() const {
    return worker_.get_id() == std::this_thread::get_id();
}

void SerialQueue::drain_inline() {
    while (true) {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lk(state_->mtx);
            if (state_->tasks.empty()) {
                state_->stopped = true;
                return;
            }
            task = std::move(state_->tasks.front());
            state_->tasks.pop_front();
        }
        task();
    }
}

void SerialQueue::run(std::shared_ptr<State> state) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(state->mtx);
            state->cv.wait(lk, [&] {
                return state->stopped || state->shutdown || !state->tasks.empty();
            });
            if (state->stopped) return;
            if (state->tasks.empty()) {
                state->stopped = true;
                return;
            }
            task = std::move(state->tasks.front());
            state->tasks.pop_front();
        }
        task();
    }
}

} // namespace feedstore
