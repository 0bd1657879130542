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

#include "worker_thread.h"
#include "logger.h"

void WorkerPool::Start()
{
    m_running.store(true, std::memory_order_release);
}

void WorkerPool::Stop()
{
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        m_running.store(false, std::memory_order_release);
        threads.swap(m_threads);
    }
    m_cv.notify_all();

    std::vector<std::thread> self;
    for (auto& t : threads)
    {
        if (!t.joinable()) continue;
        // A callback stopping its own pool cannot join itself
        if (t.get_id() == std::this_thread::get_id())
            self.push_back(std::move(t));
        else
            t.join();
    }

    if (!self.empty())
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        for (auto& t : self) m_threads.push_back(std::move(t));
    }
}

bool WorkerPool::Push(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        if (!m_running.load(std::memory_order_acquire))
            return false;

        m_tasks.push_back(std::move(task));
        if (m_tasks.size() > m_idle)
        {
            m_threads.emplace_back(&WorkerPool::WorkerLoop, this);
        }
    }
    m_cv.notify_one();
    return true;
}

size_t WorkerPool::ThreadCount()
{
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_threads.size();
}

void WorkerPool::WorkerLoop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(m_mtx);
            ++m_idle;
            m_cv.wait(lk, [this]
            {
                return !m_tasks.empty() || !m_running.load(std::memory_order_acquire);
            });
            --m_idle;

            if (m_tasks.empty())
                return;

            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }

        try
        {
            if (task) task();
        }
        catch (const std::exception& e)
        {
            Log(std::string("[TRAY] Callback threw an exception: ") + e.what());
        }
    }
}
