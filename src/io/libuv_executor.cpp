// ============================================================================
// colock/io/libuv_executor.cpp - libuv Event Loop Executor
// ============================================================================

#include "colock/io/libuv_executor.hpp"

namespace colock {

Result<std::unique_ptr<LibuvExecutor>, Error> LibuvExecutor::Create() {
    auto executor = std::unique_ptr<LibuvExecutor>(new LibuvExecutor());

    if (uv_loop_init(&executor->loop_) != 0) {
        return Err(make_error_code(Errc::ExecutorInitFailed));
    }

    if (uv_async_init(&executor->loop_, &executor->async_, OnAsync) != 0) {
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::ExecutorInitFailed));
    }
    executor->async_.data = executor.get();

    return Ok(std::move(executor));
}

LibuvExecutor::~LibuvExecutor() {
    if (running_) {
        Stop();
    }

    // The async handle must be closed, and its close callback run, before the
    // loop itself can be closed.
    uv_close(reinterpret_cast<uv_handle_t*>(&async_), nullptr);
    while (uv_loop_alive(&loop_)) {
        uv_run(&loop_, UV_RUN_ONCE);
    }
    uv_loop_close(&loop_);
}

void LibuvExecutor::Run() {
    running_ = true;
    ExecutorGuard guard(this);

    // The async handle keeps the loop alive until Stop().
    uv_run(&loop_, UV_RUN_DEFAULT);

    running_ = false;
}

void LibuvExecutor::RunOnce() {
    ExecutorGuard guard(this);
    ProcessReadyQueue();
    uv_run(&loop_, UV_RUN_NOWAIT);
}

void LibuvExecutor::Stop() {
    uv_stop(&loop_);
    running_ = false;
}

bool LibuvExecutor::IsRunning() const {
    return running_;
}

void LibuvExecutor::Schedule(std::coroutine_handle<> handle) {
    if (!handle) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ready_queue_.push(handle);
    }
    uv_async_send(&async_);
}

void LibuvExecutor::Post(std::function<void()> callback) {
    if (!callback) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        callback_queue_.push(std::move(callback));
    }
    uv_async_send(&async_);
}

void LibuvExecutor::OnAsync(uv_async_t* handle) {
    auto* self = static_cast<LibuvExecutor*>(handle->data);
    self->ProcessReadyQueue();
}

void LibuvExecutor::ProcessReadyQueue() {
    std::queue<std::coroutine_handle<>> ready;
    std::queue<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(ready, ready_queue_);
        std::swap(callbacks, callback_queue_);
    }

    while (!ready.empty()) {
        auto handle = ready.front();
        ready.pop();
        handle.resume();
    }

    while (!callbacks.empty()) {
        auto callback = std::move(callbacks.front());
        callbacks.pop();
        callback();
    }
}

}  // namespace colock
