/*
 * This file is part of TrayKit.
 *
 * Copyright (c) 2025 Ian Anthony R. Tancinco
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef TRAYKIT_WORKER_THREAD_H
#define TRAYKIT_WORKER_THREAD_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Unbounded pool for application callbacks. A task never waits behind a busy
// worker: Push() adds a thread whenever every existing worker is occupied.
// No ordering is promised between tasks.
class WorkerPool
{
public:
    WorkerPool()  = default;
    ~WorkerPool() { Stop(); }

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&)                 = delete;
    WorkerPool& operator=(WorkerPool&&)      = delete;

    // Accept tasks from now on. Threads are created lazily by Push().
    void Start();

    // Drains remaining tasks then joins every worker. Blocks until they exit.
    // Called from a worker, that worker is kept for the next Stop() to join.
    void Stop();

    // Thread-safe. Returns false (task dropped) when the pool is not running.
    bool Push(std::function<void()> task);

    size_t ThreadCount();

private:
    void WorkerLoop();

    std::vector<std::thread>           m_threads;
    std::mutex                         m_mtx;
    std::deque<std::function<void()>>  m_tasks;
    std::condition_variable            m_cv;
    std::atomic<bool>                  m_running{false};
    size_t                             m_idle = 0; // guarded by m_mtx
};

#endif // TRAYKIT_WORKER_THREAD_H
