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

#include "visible_index.h"
#include <algorithm>
#include <mutex>

int VisibleIndex::Insert(MenuItemId parent, MenuItemId id)
{
    std::unique_lock lock(m_mtx);

    // Keep the one-parent invariant if the id was listed elsewhere
    auto owner = m_owner.find(id);
    if (owner != m_owner.end() && owner->second != parent)
    {
        auto& old = m_lists[owner->second];
        old.erase(std::remove(old.begin(), old.end(), id), old.end());
    }

    auto& list = m_lists[parent];
    auto pos = std::lower_bound(list.begin(), list.end(), id);
    if (pos == list.end() || *pos != id)
    {
        pos = list.insert(pos, id);
    }
    m_owner[id] = parent;
    return static_cast<int>(pos - list.begin());
}

int VisibleIndex::IndexOf(MenuItemId parent, MenuItemId id) const
{
    std::shared_lock lock(m_mtx);
    auto it = m_lists.find(parent);
    if (it == m_lists.end()) return -1;

    const auto& list = it->second;
    auto pos = std::lower_bound(list.begin(), list.end(), id);
    if (pos == list.end() || *pos != id) return -1;
    return static_cast<int>(pos - list.begin());
}

bool VisibleIndex::Erase(MenuItemId parent, MenuItemId id)
{
    std::unique_lock lock(m_mtx);
    auto it = m_lists.find(parent);
    if (it == m_lists.end()) return false;

    auto& list = it->second;
    auto pos = std::lower_bound(list.begin(), list.end(), id);
    if (pos == list.end() || *pos != id) return false;

    list.erase(pos);
    m_owner.erase(id);
    return true;
}

void VisibleIndex::EraseParent(MenuItemId parent)
{
    std::unique_lock lock(m_mtx);
    auto it = m_lists.find(parent);
    if (it == m_lists.end()) return;

    for (MenuItemId child : it->second) m_owner.erase(child);
    m_lists.erase(it);
}

bool VisibleIndex::IsVisible(MenuItemId id) const
{
    std::shared_lock lock(m_mtx);
    return m_owner.count(id) != 0;
}

bool VisibleIndex::ParentOf(MenuItemId id, MenuItemId& parent) const
{
    std::shared_lock lock(m_mtx);
    auto it = m_owner.find(id);
    if (it == m_owner.end()) return false;
    parent = it->second;
    return true;
}

std::vector<MenuItemId> VisibleIndex::Children(MenuItemId parent) const
{
    std::shared_lock lock(m_mtx);
    auto it = m_lists.find(parent);
    if (it == m_lists.end()) return {};
    return it->second;
}

void VisibleIndex::Clear()
{
    std::unique_lock lock(m_mtx);
    m_lists.clear();
    m_owner.clear();
}
