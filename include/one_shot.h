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

#ifndef TRAYKIT_ONE_SHOT_H
#define TRAYKIT_ONE_SHOT_H

#include <atomic>
#include <functional>
#include <mutex>

// Execute-once gate. Concurrent callers block until the single run finishes.
class OneShot {
public:
    OneShot() = default;

    OneShot(const OneShot&) = delete;
    OneShot& operator=(const OneShot&) = delete;

    // Returns true for the caller whose fn actually ran.
    bool Run(const std::function<void()>& fn)
    {
        bool ran = false;
        std::call_once(m_flag, [&] {
            m_fired.store(true, std::memory_order_release);
            ran = true;
            if (fn) fn();
        });
        return ran;
    }

    bool Fired() const { return m_fired.load(std::memory_order_acquire); }

private:
    std::once_flag m_flag;
    std::atomic<bool> m_fired{false};
};

#endif // TRAYKIT_ONE_SHOT_H
