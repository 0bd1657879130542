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

#ifndef TRAYKIT_NATIVE_SURFACE_H
#define TRAYKIT_NATIVE_SURFACE_H

#include "types.h"
#include <cstdint>
#include <string>
#include <vector>

enum class TrayEventKind {
    ItemActivated,   // Menu command; itemId is set
    TrayIconClick,   // Notification-area icon clicked; button is set
    Close,           // Window asked to close
    Destroy,         // Window destroyed
    EndSession,      // User session ending
    TaskbarCreated,  // Shell restarted, tray icon must be re-added
    Unrecognized
};

enum class TrayMouseButton { None, Left, Right };

struct TrayEvent {
    TrayEventKind kind = TrayEventKind::Unrecognized;
    MenuItemId itemId = 0;
    TrayMouseButton button = TrayMouseButton::None;
};

// Receives translated native messages on the owning context.
class TrayEventSink {
public:
    virtual ~TrayEventSink() = default;

    // Returns false to let the surface apply native default handling.
    virtual bool OnTrayEvent(const TrayEvent& ev) = 0;
};

enum class PumpResult { Dispatched, Quit, Failed };

// The OS menu widget tree and notification-area resource, driven by position
// and id. Implementations never throw; failures come back as TrayResult.
class NativeMenuSurface {
public:
    virtual ~NativeMenuSurface() = default;

    // Window class, hidden window and message ids. Events go to sink.
    virtual TrayResult RegisterWindow(TrayEventSink* sink) = 0;
    // Destroys the window and unregisters its class.
    virtual void UnregisterWindow() = 0;

    // Notification-area resource
    virtual TrayResult AddTrayIcon() = 0;
    virtual TrayResult SetTrayIcon(NativeHandle icon) = 0;
    virtual TrayResult SetTrayTooltip(const std::string& text) = 0;
    virtual TrayResult DeleteTrayIcon() = 0;

    // Menus
    virtual TrayResult CreateRootMenu(NativeHandle& out) = 0;
    virtual TrayResult CreateSubMenu(NativeHandle& out) = 0;
    virtual TrayResult AttachSubMenu(NativeHandle menu, MenuItemId itemId, NativeHandle submenu) = 0;
    virtual TrayResult DestroyMenu(NativeHandle menu) = 0;
    virtual TrayResult InsertItem(NativeHandle menu, int position, const NativeItemInfo& info) = 0;
    virtual TrayResult UpdateItem(NativeHandle menu, const NativeItemInfo& info) = 0;
    // DeleteItem frees the item's native resources, RemoveItem only detaches it.
    virtual TrayResult DeleteItem(NativeHandle menu, MenuItemId id) = 0;
    virtual TrayResult RemoveItem(NativeHandle menu, MenuItemId id) = 0;
    virtual TrayResult ShowPopup(NativeHandle menu) = 0;

    // Icons
    virtual TrayResult LoadIconFromFile(const std::string& path, NativeHandle& out) = 0;
    virtual TrayResult LoadIconFromBytes(const std::vector<uint8_t>& bytes, NativeHandle& out) = 0;
    virtual TrayResult IconToMenuBitmap(NativeHandle icon, NativeHandle& out) = 0;

    // Message pump. Blocks until one message was handled or the loop ends.
    virtual PumpResult PumpMessage() = 0;
    virtual void PostClose() = 0;
    virtual void PostQuit(int exitCode) = 0;
};

#endif // TRAYKIT_NATIVE_SURFACE_H
