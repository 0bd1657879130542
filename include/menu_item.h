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

#ifndef TRAYKIT_MENU_ITEM_H
#define TRAYKIT_MENU_ITEM_H

#include "types.h"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

class TraySession;

// Lightweight handle to one menu entry. Copyable; all state lives in the
// session's registry, so a handle to a removed item simply stops working
// (operations return UnknownItem, getters return defaults).
// Every operation may be called from any thread.
class MenuItem {
public:
    MenuItem() = default;
    MenuItem(TraySession* session, MenuItemId id) : m_session(session), m_id(id) {}

    bool IsValid() const { return m_session != nullptr && m_id != 0; }
    MenuItemId Id() const { return m_id; }
    MenuItemId ParentId() const;

    std::string Title() const;
    bool Disabled() const;
    bool Checked() const;

    // Called on a worker thread for every click.
    void SetCallback(std::function<void()> onClick);

    // Nested items
    MenuItem AddSubMenuItem(const std::string& title);
    TrayResult AddSeparator();

    TrayResult SetTitle(const std::string& title);
    TrayResult Enable();
    TrayResult Disable();
    TrayResult Check();
    TrayResult Uncheck();
    TrayResult Hide();
    TrayResult Show();

    // Removes this item and every descendant.
    TrayResult Remove();

    // iconBytes is the content of an .ico image
    TrayResult SetIcon(const std::vector<uint8_t>& iconBytes);
    TrayResult SetIconFromFilePath(const std::string& iconFilePath);

    std::string ToString() const;

    bool operator==(const MenuItem& other) const
    {
        return m_session == other.m_session && m_id == other.m_id;
    }

private:
    TraySession* m_session = nullptr;
    MenuItemId m_id = 0;
};

#endif // TRAYKIT_MENU_ITEM_H
