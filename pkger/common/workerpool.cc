/* workerpool.cc - Fixed-size pool for background refreshes and queries
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "workerpool.h"
#include "structuredlog.h"

namespace Pkger {

WorkerPool::WorkerPool(size_t threads)
{
    if (threads == 0) {
        threads = 1;
    }
    for (size_t i = 0; i < threads; ++i) {
        _threads.emplace_back([this]() { workerLoop(); });
    }
}

WorkerPool::~WorkerPool()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _stopping = true;
        _queue.clear();
    }
    _cv.notify_all();
    _idleCv.notify_all();

    for (auto& t : _threads) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerPool::enqueue(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping) {
            return;
        }
        _queue.push_back(std::move(job));
    }
    _cv.notify_one();
}

void WorkerPool::waitIdle()
{
    std::unique_lock<std::mutex> lock(_mutex);
    _idleCv.wait(lock, [this]() {
        return _stopping || (_queue.empty() && _running == 0);
    });
}

size_t WorkerPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
}

void WorkerPool::workerLoop()
{
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _cv.wait(lock, [this]() { return _stopping || !_queue.empty(); });
            if (_stopping) {
                return;
            }
            job = std::move(_queue.front());
            _queue.pop_front();
            ++_running;
        }

        // packaged_task stores exceptions in the future; plain jobs must not throw
        try {
            job();
        } catch (const std::exception& e) {
            LOG(LogLevel::ERROR)
                .component("WorkerPool")
                .message(std::string("Background task failed: ") + e.what())
                .emit();
        }

        {
            std::lock_guard<std::mutex> lock(_mutex);
            --_running;
            if (_queue.empty() && _running == 0) {
                _idleCv.notify_all();
            }
        }
    }
}

} // namespace Pkger

// vim:ts=4:sw=4:et
