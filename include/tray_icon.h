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

#ifndef TRAYKIT_TRAY_ICON_H
#define TRAYKIT_TRAY_ICON_H

#include "types.h"
#include "native_surface.h"
#include <mutex>
#include <string>

// The single notification-area resource. Remembers icon and tooltip so the
// entry can be restored after the shell drops it.
class TrayIcon {
public:
    explicit TrayIcon(NativeMenuSurface& surface) : m_surface(surface) {}

    TrayIcon(const TrayIcon&) = delete;
    TrayIcon& operator=(const TrayIcon&) = delete;

    // Lifecycle
    TrayResult Add();
    TrayResult Remove();   // No-op once removed

    // Event Handlers
    void OnTaskbarRestart();

    // Control
    TrayResult SetIcon(NativeHandle icon);
    TrayResult UpdateTooltip(const std::string& text);

    bool IsPresent() const;
    NativeHandle Icon() const;
    std::string Tooltip() const;

private:
    NativeMenuSurface& m_surface;
    mutable std::mutex m_mtx;
    bool m_present = false;
    NativeHandle m_icon = NULL_HANDLE;
    std::string m_tooltip;
};

#endif // TRAYKIT_TRAY_ICON_H
