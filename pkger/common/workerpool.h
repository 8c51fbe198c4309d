/* workerpool.h - Fixed-size pool for background refreshes and queries
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _WORKERPOOL_H_
#define _WORKERPOOL_H_

#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>

namespace Pkger {

/**
 * WorkerPool - FIFO task queue served by a fixed number of threads
 *
 * Tasks still queued when the pool is destroyed are dropped; waiting on
 * their futures then reports a broken promise. Running tasks are joined.
 */
class WorkerPool {
public:
    /**
     * Start the worker threads.
     *
     * @param threads  Number of threads; 0 is treated as 1
     */
    explicit WorkerPool(size_t threads = 2);

    /**
     * Stop accepting work, drop queued tasks and join the threads.
     * Returns once every running task has finished.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Queue a callable and return a future for its result.
     *
     * Exceptions thrown by the task are stored in the future and rethrown
     * by get().
     *
     * @param task  Callable taking no arguments
     * @return Future holding the task's return value
     */
    template<typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<F>> {
        using Result = std::invoke_result_t<F>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        std::future<Result> future = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return future;
    }

    // Block until the queue is empty and no task is running
    void waitIdle();

    size_t threadCount() const { return _threads.size(); }

    /**
     * Number of tasks waiting for a thread (running tasks excluded).
     */
    size_t pendingCount() const;

private:
    /**
     * Append a job and wake one worker. Jobs submitted after shutdown
     * began are discarded.
     */
    void enqueue(std::function<void()> job);

    /**
     * Thread body: take jobs in FIFO order until stopping, keeping
     * _running current so waitIdle() can tell when the pool drained.
     */
    void workerLoop();

    std::vector<std::thread> _threads;
    std::deque<std::function<void()>> _queue;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::condition_variable _idleCv;
    size_t _running = 0;
    bool _stopping = false;
};

} // namespace Pkger

#endif // _WORKERPOOL_H_

// vim:ts=4:sw=4:et
