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

#ifndef TRAYKIT_MENU_SYNC_H
#define TRAYKIT_MENU_SYNC_H

#include "types.h"
#include "native_surface.h"
#include "menu_registry.h"
#include "visible_index.h"
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

// Keeps the native menu tree in step with the registry.
//
// The native surface addresses entries by position, so every insert derives
// its position from the visible index at the moment of the call. Structural
// commands are serialized by a command mutex that is private to this class;
// the registry lock is never held while a command runs. The handle tables
// each have their own lock, taken only around the table access.
//
// With a registry attached, Upsert and SetItemBitmap re-check under the
// command mutex that the item (and a non-root parent) is still live, so a
// removal that already started wins over a late update.
class MenuSync {
public:
    explicit MenuSync(NativeMenuSurface& surface, const MenuRegistry* registry = nullptr)
        : m_surface(surface), m_registry(registry) {}

    MenuSync(const MenuSync&) = delete;
    MenuSync& operator=(const MenuSync&) = delete;

    TrayResult CreateRoot();
    TrayResult DestroyRoot();
    bool HasRoot() const;

    // Drops every table entry (handles, owners, bitmaps, visible lists).
    void Clear();

    // Adds the item to its parent menu or updates it in place.
    // Promotes the parent to a submenu on its first child.
    TrayResult Upsert(const MenuItemRecord& item);

    // Detaches the native entry but keeps its resources for a later Upsert.
    TrayResult Hide(MenuItemId id, MenuItemId parent);

    // Destroys the native entry (and its submenu) and forgets the id.
    TrayResult Delete(MenuItemId id, MenuItemId parent);

    // Drops all bookkeeping for id without touching the native surface.
    void Forget(MenuItemId id, MenuItemId parent);

    TrayResult ShowPopup();

    // Returns false when id is no longer live
    bool SetItemBitmap(MenuItemId id, NativeHandle bitmap);
    NativeHandle ItemBitmap(MenuItemId id) const;

    // Submenu owned by id (root menu for id 0)
    bool SubMenuOf(MenuItemId id, NativeHandle& out) const;
    // Native menu that currently holds id's entry
    bool MenuOf(MenuItemId id, NativeHandle& out) const;

    const VisibleIndex& Visible() const { return m_visible; }

private:
    TrayResult Promote(MenuItemId parent, NativeHandle& out);
    NativeItemInfo BuildInfo(const MenuItemRecord& item) const;
    void DropTables(MenuItemId id);
    bool IsLive(MenuItemId id) const;

    NativeMenuSurface& m_surface;
    const MenuRegistry* m_registry;
    std::mutex m_commandMtx;

    mutable std::shared_mutex m_menusMtx;
    std::unordered_map<MenuItemId, NativeHandle> m_menus;   // owner id -> submenu

    mutable std::shared_mutex m_menuOfMtx;
    std::unordered_map<MenuItemId, NativeHandle> m_menuOf;  // item id -> containing menu

    mutable std::shared_mutex m_bitmapMtx;
    std::unordered_map<MenuItemId, NativeHandle> m_bitmaps;

    VisibleIndex m_visible;
};

#endif // TRAYKIT_MENU_SYNC_H
