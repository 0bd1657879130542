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

#ifndef TRAYKIT_ID_ALLOCATOR_H
#define TRAYKIT_ID_ALLOCATOR_H

#include "types.h"
#include <atomic>

// Issues menu item ids. Strictly increasing, never reused, first id is 1.
class IdAllocator {
public:
    IdAllocator() = default;

    IdAllocator(const IdAllocator&) = delete;
    IdAllocator& operator=(const IdAllocator&) = delete;

    // Thread-safe.
    MenuItemId Next();

    // Last id handed out (0 if none yet).
    MenuItemId Current() const;

private:
    std::atomic<MenuItemId> m_last{0};
};

#endif // TRAYKIT_ID_ALLOCATOR_H
