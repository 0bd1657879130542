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

#ifndef TRAYKIT_VISIBLE_INDEX_H
#define TRAYKIT_VISIBLE_INDEX_H

#include "types.h"
#include <shared_mutex>
#include <unordered_map>
#include <vector>

// Per-parent list of the child ids currently present in the native menu,
// kept in ascending id order. A child is listed under at most one parent.
// The position of an id in its list is the native insert position.
class VisibleIndex {
public:
    VisibleIndex() = default;

    VisibleIndex(const VisibleIndex&) = delete;
    VisibleIndex& operator=(const VisibleIndex&) = delete;

    // Inserts id under parent (sorted) and returns its index.
    // An id already listed under parent keeps its slot.
    int Insert(MenuItemId parent, MenuItemId id);

    // Index of id under parent, or -1.
    int IndexOf(MenuItemId parent, MenuItemId id) const;

    bool Erase(MenuItemId parent, MenuItemId id);
    void EraseParent(MenuItemId parent);

    bool IsVisible(MenuItemId id) const;
    bool ParentOf(MenuItemId id, MenuItemId& parent) const;

    std::vector<MenuItemId> Children(MenuItemId parent) const;
    void Clear();

private:
    mutable std::shared_mutex m_mtx;
    std::unordered_map<MenuItemId, std::vector<MenuItemId>> m_lists;
    std::unordered_map<MenuItemId, MenuItemId> m_owner; // child -> parent
};

#endif // TRAYKIT_VISIBLE_INDEX_H
