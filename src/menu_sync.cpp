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

#include "menu_sync.h"
#include "logger.h"
#include <string>

TrayResult MenuSync::CreateRoot()
{
    std::lock_guard cmd(m_commandMtx);

    NativeHandle root = NULL_HANDLE;
    TrayResult r = m_surface.CreateRootMenu(root);
    if (!r.ok()) return r;

    std::unique_lock lock(m_menusMtx);
    m_menus[ROOT_MENU_ID] = root;
    return TrayResult::Ok();
}

TrayResult MenuSync::DestroyRoot()
{
    std::lock_guard cmd(m_commandMtx);

    NativeHandle root = NULL_HANDLE;
    if (!SubMenuOf(ROOT_MENU_ID, root))
        return TrayResult::Fail(TrayError::NotReady, "root menu not created");

    TrayResult r = m_surface.DestroyMenu(root);

    std::unique_lock lock(m_menusMtx);
    m_menus.erase(ROOT_MENU_ID);
    return r;
}

bool MenuSync::HasRoot() const
{
    std::shared_lock lock(m_menusMtx);
    return m_menus.count(ROOT_MENU_ID) != 0;
}

void MenuSync::Clear()
{
    std::lock_guard cmd(m_commandMtx);
    {
        std::unique_lock lock(m_menusMtx);
        m_menus.clear();
    }
    {
        std::unique_lock lock(m_menuOfMtx);
        m_menuOf.clear();
    }
    {
        std::unique_lock lock(m_bitmapMtx);
        m_bitmaps.clear();
    }
    m_visible.Clear();
}

NativeItemInfo MenuSync::BuildInfo(const MenuItemRecord& item) const
{
    NativeItemInfo info;
    info.id = item.id;
    info.title = item.title;
    info.separator = item.separator;
    info.disabled = item.disabled;
    info.checked = item.checked;
    info.bitmap = ItemBitmap(item.id);
    return info;
}

TrayResult MenuSync::Promote(MenuItemId parent, NativeHandle& out)
{
    NativeHandle submenu = NULL_HANDLE;
    TrayResult r = m_surface.CreateSubMenu(submenu);
    if (!r.ok()) return r;

    // A hidden parent gets its submenu attached when it is shown again
    NativeHandle owner = NULL_HANDLE;
    if (m_visible.IsVisible(parent) && MenuOf(parent, owner))
    {
        r = m_surface.AttachSubMenu(owner, parent, submenu);
        if (!r.ok())
        {
            TrayResult cleanup = m_surface.DestroyMenu(submenu);
            if (!cleanup.ok())
                Log("[MENU] Failed to free unattached submenu: " + cleanup.message);
            return r;
        }
    }

    {
        std::unique_lock lock(m_menusMtx);
        m_menus[parent] = submenu;
    }
    out = submenu;
    return TrayResult::Ok();
}

bool MenuSync::IsLive(MenuItemId id) const
{
    return !m_registry || id == ROOT_MENU_ID || m_registry->Contains(id);
}

TrayResult MenuSync::Upsert(const MenuItemRecord& item)
{
    std::lock_guard cmd(m_commandMtx);

    if (!IsLive(item.id) || !IsLive(item.parent))
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(item.id));

    NativeHandle menu = NULL_HANDLE;
    if (!SubMenuOf(item.parent, menu))
    {
        if (item.parent == ROOT_MENU_ID)
            return TrayResult::Fail(TrayError::NotReady, "root menu not created");

        TrayResult r = Promote(item.parent, menu);
        if (!r.ok()) return r;
    }

    NativeItemInfo info = BuildInfo(item);

    if (m_visible.IndexOf(item.parent, item.id) != -1)
    {
        return m_surface.UpdateItem(menu, info);
    }

    // New or re-shown entry: keep a nested menu it already owns
    NativeHandle submenu = NULL_HANDLE;
    if (SubMenuOf(item.id, submenu))
    {
        info.submenu = submenu;
    }

    int position = m_visible.Insert(item.parent, item.id);
    TrayResult r = m_surface.InsertItem(menu, position, info);
    if (!r.ok())
    {
        m_visible.Erase(item.parent, item.id);
        return r;
    }

    std::unique_lock lock(m_menuOfMtx);
    m_menuOf[item.id] = menu;
    return TrayResult::Ok();
}

TrayResult MenuSync::Hide(MenuItemId id, MenuItemId parent)
{
    std::lock_guard cmd(m_commandMtx);

    if (m_visible.IndexOf(parent, id) == -1) return TrayResult::Ok();

    NativeHandle menu = NULL_HANDLE;
    if (!SubMenuOf(parent, menu))
        return TrayResult::Fail(TrayError::NotReady, "parent menu not created");

    TrayResult r = m_surface.RemoveItem(menu, id);
    if (!r.ok()) return r;

    m_visible.Erase(parent, id);
    return TrayResult::Ok();
}

TrayResult MenuSync::Delete(MenuItemId id, MenuItemId parent)
{
    std::lock_guard cmd(m_commandMtx);

    if (m_visible.IndexOf(parent, id) != -1)
    {
        NativeHandle menu = NULL_HANDLE;
        if (!SubMenuOf(parent, menu))
            return TrayResult::Fail(TrayError::NotReady, "parent menu not created");

        TrayResult r = m_surface.DeleteItem(menu, id);
        if (!r.ok()) return r;

        m_visible.Erase(parent, id);
    }
    else
    {
        // Hidden entries are detached, so their submenu is not freed with them
        NativeHandle submenu = NULL_HANDLE;
        if (SubMenuOf(id, submenu))
        {
            TrayResult r = m_surface.DestroyMenu(submenu);
            if (!r.ok()) return r;
        }
    }

    DropTables(id);
    return TrayResult::Ok();
}

void MenuSync::Forget(MenuItemId id, MenuItemId parent)
{
    std::lock_guard cmd(m_commandMtx);
    m_visible.Erase(parent, id);
    DropTables(id);
}

void MenuSync::DropTables(MenuItemId id)
{
    {
        std::unique_lock lock(m_menusMtx);
        m_menus.erase(id);
    }
    {
        std::unique_lock lock(m_menuOfMtx);
        m_menuOf.erase(id);
    }
    {
        std::unique_lock lock(m_bitmapMtx);
        m_bitmaps.erase(id);
    }
    m_visible.EraseParent(id);
}

TrayResult MenuSync::ShowPopup()
{
    NativeHandle root = NULL_HANDLE;
    if (!SubMenuOf(ROOT_MENU_ID, root))
        return TrayResult::Fail(TrayError::NotReady, "root menu not created");

    return m_surface.ShowPopup(root);
}

bool MenuSync::SetItemBitmap(MenuItemId id, NativeHandle bitmap)
{
    std::lock_guard cmd(m_commandMtx);
    if (!IsLive(id)) return false;

    std::unique_lock lock(m_bitmapMtx);
    m_bitmaps[id] = bitmap;
    return true;
}

NativeHandle MenuSync::ItemBitmap(MenuItemId id) const
{
    std::shared_lock lock(m_bitmapMtx);
    auto it = m_bitmaps.find(id);
    return it == m_bitmaps.end() ? NULL_HANDLE : it->second;
}

bool MenuSync::SubMenuOf(MenuItemId id, NativeHandle& out) const
{
    std::shared_lock lock(m_menusMtx);
    auto it = m_menus.find(id);
    if (it == m_menus.end()) return false;
    out = it->second;
    return true;
}

bool MenuSync::MenuOf(MenuItemId id, NativeHandle& out) const
{
    std::shared_lock lock(m_menuOfMtx);
    auto it = m_menuOf.find(id);
    if (it == m_menuOf.end()) return false;
    out = it->second;
    return true;
}
