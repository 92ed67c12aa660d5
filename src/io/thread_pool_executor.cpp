// ============================================================================
// colock/io/thread_pool_executor.cpp - Multi-Threaded Executor
// ============================================================================

#include "colock/io/thread_pool_executor.hpp"

#include <pthread.h>

namespace colock {

namespace {

void NameCurrentThread(const std::string& name) {
    // Linux limits thread names to 15 characters plus the terminator.
    std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
}

}  // namespace

ThreadPoolExecutor::ThreadPoolExecutor() : ThreadPoolExecutor(Options{}) {}

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads) {
    options_.num_threads = num_threads;
    InitWorkers();
}

ThreadPoolExecutor::ThreadPoolExecutor(const Options& options) : options_(options) {
    InitWorkers();
}

void ThreadPoolExecutor::InitWorkers() {
    if (options_.num_threads == 0) {
        options_.num_threads = 1;
    }
    running_ = true;

    workers_.reserve(options_.num_threads);
    for (size_t i = 0; i < options_.num_threads; ++i) {
        workers_.emplace_back([this, i] { WorkerLoop(i); });
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    Stop();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    // Queued handles are not destroyed here: coroutine frames belong to their
    // Task or spawn wrapper.
}

void ThreadPoolExecutor::Run() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    work_available_.wait(lock, [this] { return stopping_ || (work_queue_.empty() && active_tasks_ == 0); });
}

void ThreadPoolExecutor::RunOnce() {
    WorkItem item{std::coroutine_handle<>{nullptr}};
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (work_queue_.empty()) {
            return;
        }
        item = std::move(work_queue_.front());
        work_queue_.pop();
        active_tasks_++;
    }

    ExecutorGuard guard(this);
    Execute(item);
}

void ThreadPoolExecutor::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
        running_ = false;
    }
    work_available_.notify_all();
}

bool ThreadPoolExecutor::IsRunning() const {
    return running_;
}

void ThreadPoolExecutor::Schedule(std::coroutine_handle<> handle) {
    if (!handle) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        work_queue_.emplace(handle);
    }
    work_available_.notify_one();
}

void ThreadPoolExecutor::Post(std::function<void()> callback) {
    if (!callback) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        work_queue_.emplace(std::move(callback));
    }
    work_available_.notify_one();
}

size_t ThreadPoolExecutor::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return work_queue_.size();
}

void ThreadPoolExecutor::Execute(WorkItem& item) {
    if (item.handle) {
        item.handle.resume();
    } else if (item.callback) {
        item.callback();
    }

    {
        // Decrement under the lock so Run() cannot miss the idle transition.
        std::lock_guard<std::mutex> lock(queue_mutex_);
        active_tasks_--;
    }
    work_available_.notify_all();
}

void ThreadPoolExecutor::WorkerLoop(size_t worker_index) {
    SetCurrentExecutor(this);
    if (!options_.thread_name_prefix.empty()) {
        NameCurrentThread(options_.thread_name_prefix + "-" + std::to_string(worker_index));
    }

    while (true) {
        WorkItem item{std::coroutine_handle<>{nullptr}};
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !work_queue_.empty(); });

            if (stopping_) {
                break;
            }

            item = std::move(work_queue_.front());
            work_queue_.pop();
            // Counted while still holding the lock so Run() never sees an
            // empty queue with the item in flight uncounted.
            active_tasks_++;
        }

        Execute(item);
    }

    SetCurrentExecutor(nullptr);
}

}  // namespace colock
