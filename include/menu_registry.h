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

#ifndef TRAYKIT_MENU_REGISTRY_H
#define TRAYKIT_MENU_REGISTRY_H

#include "types.h"
#include "id_allocator.h"
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// One node of the menu tree. The parent is stored as an id, never as a pointer.
struct MenuItemRecord {
    MenuItemId id = 0;
    MenuItemId parent = ROOT_MENU_ID;
    std::string title;
    bool disabled = false;
    bool checked = false;
    bool separator = false;
    std::function<void()> onClick;
};

// Arena of menu item records keyed by id.
// Reads take a shared lock, structural writes an exclusive one. The lock is
// never held while a caller-supplied function runs.
//
// A record being removed is invisible to every reader and setter from the
// moment Remove() starts, although it is only erased after its onDetach.
class MenuRegistry {
public:
    explicit MenuRegistry(IdAllocator& ids) : m_ids(ids) {}

    MenuRegistry(const MenuRegistry&) = delete;
    MenuRegistry& operator=(const MenuRegistry&) = delete;

    // Allocates an id and stores a new record. Does not touch the native surface.
    // Returns a record with id 0 when parent is neither the root nor a live item.
    MenuItemRecord Create(const std::string& title, MenuItemId parent, bool separator = false);

    // Copies the record for id into out. Returns false if unknown.
    bool Find(MenuItemId id, MenuItemRecord& out) const;
    bool Contains(MenuItemId id) const;

    // Setters return false for unknown ids; on success snapshot receives the updated record
    bool SetTitle(MenuItemId id, const std::string& title, MenuItemRecord* snapshot = nullptr);
    bool SetDisabled(MenuItemId id, bool disabled, MenuItemRecord* snapshot = nullptr);
    bool SetChecked(MenuItemId id, bool checked, MenuItemRecord* snapshot = nullptr);
    bool SetCallback(MenuItemId id, std::function<void()> onClick);

    // Depth-first removal: every descendant is detached and erased before its
    // parent. The whole subtree is claimed under one exclusive lock, so an item
    // added under it concurrently is either claimed too or rejected by Create.
    // onDetach runs without the lock held, right before each erase.
    void Remove(MenuItemId id, const std::function<void(const MenuItemRecord&)>& onDetach);

    std::vector<MenuItemId> ChildrenOf(MenuItemId parent) const;
    std::vector<MenuItemId> Ids() const;
    size_t Size() const;

private:
    bool Mutate(MenuItemId id, const std::function<void(MenuItemRecord&)>& fn, MenuItemRecord* snapshot);

    // m_mtx must be held by the caller
    bool IsLiveLocked(MenuItemId id) const;
    void CollectSubtreeLocked(MenuItemId id, std::vector<MenuItemRecord>& out) const;

    IdAllocator& m_ids;
    mutable std::shared_mutex m_mtx;
    std::unordered_map<MenuItemId, MenuItemRecord> m_items;
    std::unordered_set<MenuItemId> m_removing;
};

#endif // TRAYKIT_MENU_REGISTRY_H
