#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

/*
 * BACKGROUND TASKS
 *
 * Network calls the caller may stop waiting on once its deadline passes. Each
 * worker runs on its own detached thread and reports through a future; the
 * group keeps count of the workers still running so shutdown can wait for
 * them before tearing down libcurl.
 */
class BackgroundTasks {
public:
    BackgroundTasks() : state_(std::make_shared<State>()) {}

    template<typename Func>
    auto launch(Func func) -> std::future<decltype(func())> {
        using Result = decltype(func());
        auto promise = std::make_shared<std::promise<Result>>();
        std::future<Result> future = promise->get_future();

        // Workers hold the counter, not the group, so they may outlive it
        std::shared_ptr<State> state = state_;
        state->started();
        try {
            std::thread([state, promise, func]() mutable {
                try {
                    promise->set_value(func());
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
                state->finished();
            }).detach();
        } catch (...) {
            state->finished();
            throw;
        }
        return future;
    }

    // True once every worker has returned; false if `timeout` ran out first
    bool wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->idle.wait_for(lock, timeout, [this]() { return state_->running == 0; });
    }

    size_t in_flight() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->running;
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable idle;
        size_t running = 0;

        void started() {
            std::lock_guard<std::mutex> lock(mutex);
            running++;
        }
        void finished() {
            std::lock_guard<std::mutex> lock(mutex);
            if (--running == 0) idle.notify_all();
        }
    };

    std::shared_ptr<State> state_;
};

// Shared by the trading loop and the advisor; main() drains it before exit
BackgroundTasks& background_tasks();
