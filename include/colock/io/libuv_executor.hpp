// ============================================================================
// colock/io/libuv_executor.hpp - libuv Event Loop Executor
// ============================================================================
//
// LibuvExecutor lets lock waiters live on a libuv loop next to the rest of an
// application's I/O. Schedule() and Post() are thread-safe: they push onto a
// mutex-protected queue and poke the loop through a uv_async_t, whose callback
// drains the queue on the loop thread.
//
// USAGE:
// ------
//   auto executor = LibuvExecutor::Create();
//   if (executor.IsErr()) { ... }
//   Spawn(*executor.Value(), UpdateConfig(config_lock));
//   executor.Value()->Run();
//
// ============================================================================

#pragma once

#include "colock/core/error.hpp"
#include "colock/core/result.hpp"
#include "colock/io/executor.hpp"

#include <atomic>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <uv.h>

namespace colock {

class LibuvExecutor : public Executor {
   public:
    static Result<std::unique_ptr<LibuvExecutor>, Error> Create();

    ~LibuvExecutor() override;

    // libuv handles must not move once initialized.
    LibuvExecutor(const LibuvExecutor&) = delete;
    LibuvExecutor& operator=(const LibuvExecutor&) = delete;

    void Run() override;
    void RunOnce() override;
    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;

    uv_loop_t* GetLoop() { return &loop_; }

   private:
    LibuvExecutor() = default;

    static void OnAsync(uv_async_t* handle);

    void ProcessReadyQueue();

    uv_loop_t loop_{};
    uv_async_t async_{};
    std::atomic<bool> running_{false};

    std::mutex queue_mutex_;
    std::queue<std::coroutine_handle<>> ready_queue_;
    std::queue<std::function<void()>> callback_queue_;
};

}  // namespace colock
