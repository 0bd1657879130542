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

#include "menu_registry.h"
#include <algorithm>
#include <mutex>

MenuItemRecord MenuRegistry::Create(const std::string& title, MenuItemId parent, bool separator)
{
    std::unique_lock lock(m_mtx);
    if (parent != ROOT_MENU_ID && !IsLiveLocked(parent)) return MenuItemRecord{ 0 };

    MenuItemRecord rec;
    rec.id = m_ids.Next();
    rec.parent = parent;
    rec.title = title;
    rec.separator = separator;

    m_items[rec.id] = rec;
    return rec;
}

bool MenuRegistry::IsLiveLocked(MenuItemId id) const
{
    return m_items.count(id) != 0 && m_removing.count(id) == 0;
}

bool MenuRegistry::Find(MenuItemId id, MenuItemRecord& out) const
{
    std::shared_lock lock(m_mtx);
    if (!IsLiveLocked(id)) return false;
    out = m_items.at(id);
    return true;
}

bool MenuRegistry::Contains(MenuItemId id) const
{
    std::shared_lock lock(m_mtx);
    return IsLiveLocked(id);
}

bool MenuRegistry::Mutate(MenuItemId id, const std::function<void(MenuItemRecord&)>& fn, MenuItemRecord* snapshot)
{
    std::unique_lock lock(m_mtx);
    if (!IsLiveLocked(id)) return false;
    MenuItemRecord& rec = m_items.at(id);
    fn(rec);
    if (snapshot) *snapshot = rec;
    return true;
}

bool MenuRegistry::SetTitle(MenuItemId id, const std::string& title, MenuItemRecord* snapshot)
{
    return Mutate(id, [&](MenuItemRecord& r) { r.title = title; }, snapshot);
}

bool MenuRegistry::SetDisabled(MenuItemId id, bool disabled, MenuItemRecord* snapshot)
{
    return Mutate(id, [&](MenuItemRecord& r) { r.disabled = disabled; }, snapshot);
}

bool MenuRegistry::SetChecked(MenuItemId id, bool checked, MenuItemRecord* snapshot)
{
    return Mutate(id, [&](MenuItemRecord& r) { r.checked = checked; }, snapshot);
}

bool MenuRegistry::SetCallback(MenuItemId id, std::function<void()> onClick)
{
    return Mutate(id, [&](MenuItemRecord& r) { r.onClick = std::move(onClick); }, nullptr);
}

void MenuRegistry::CollectSubtreeLocked(MenuItemId id, std::vector<MenuItemRecord>& out) const
{
    std::vector<MenuItemId> children;
    for (const auto& [childId, rec] : m_items)
    {
        if (rec.parent == id && m_removing.count(childId) == 0) children.push_back(childId);
    }
    std::sort(children.begin(), children.end());

    for (MenuItemId child : children)
    {
        CollectSubtreeLocked(child, out);
    }
    if (id != ROOT_MENU_ID) out.push_back(m_items.at(id));
}

void MenuRegistry::Remove(MenuItemId id, const std::function<void(const MenuItemRecord&)>& onDetach)
{
    std::vector<MenuItemRecord> doomed;
    {
        std::unique_lock lock(m_mtx);
        if (id != ROOT_MENU_ID && !IsLiveLocked(id)) return;

        CollectSubtreeLocked(id, doomed);
        for (const auto& rec : doomed) m_removing.insert(rec.id);
    }

    for (const auto& rec : doomed)
    {
        if (onDetach) onDetach(rec);

        std::unique_lock lock(m_mtx);
        m_items.erase(rec.id);
        m_removing.erase(rec.id);
    }
}

std::vector<MenuItemId> MenuRegistry::ChildrenOf(MenuItemId parent) const
{
    std::vector<MenuItemId> children;
    {
        std::shared_lock lock(m_mtx);
        for (const auto& [id, rec] : m_items)
        {
            if (rec.parent == parent && m_removing.count(id) == 0) children.push_back(id);
        }
    }
    std::sort(children.begin(), children.end());
    return children;
}

std::vector<MenuItemId> MenuRegistry::Ids() const
{
    std::vector<MenuItemId> ids;
    {
        std::shared_lock lock(m_mtx);
        ids.reserve(m_items.size());
        for (const auto& [id, rec] : m_items)
        {
            if (m_removing.count(id) == 0) ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t MenuRegistry::Size() const
{
    std::shared_lock lock(m_mtx);
    return m_items.size() - m_removing.size();
}
