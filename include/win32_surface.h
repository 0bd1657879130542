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

#ifndef TRAYKIT_WIN32_SURFACE_H
#define TRAYKIT_WIN32_SURFACE_H

#ifdef _WIN32

#include "native_surface.h"
#include <atomic>
#include <memory>
#include <windows.h>
#include <shellapi.h>

// Hidden message-only style window plus Shell_NotifyIcon entry and Win32
// popup menus. Every call must come from the thread that registered the
// window, except PostClose and PostQuit.
class Win32MenuSurface : public NativeMenuSurface {
public:
    Win32MenuSurface() = default;
    ~Win32MenuSurface() override;

    Win32MenuSurface(const Win32MenuSurface&) = delete;
    Win32MenuSurface& operator=(const Win32MenuSurface&) = delete;

    TrayResult RegisterWindow(TrayEventSink* sink) override;
    void UnregisterWindow() override;

    TrayResult AddTrayIcon() override;
    TrayResult SetTrayIcon(NativeHandle icon) override;
    TrayResult SetTrayTooltip(const std::string& text) override;
    TrayResult DeleteTrayIcon() override;

    TrayResult CreateRootMenu(NativeHandle& out) override;
    TrayResult CreateSubMenu(NativeHandle& out) override;
    TrayResult AttachSubMenu(NativeHandle menu, MenuItemId itemId, NativeHandle submenu) override;
    TrayResult DestroyMenu(NativeHandle menu) override;
    TrayResult InsertItem(NativeHandle menu, int position, const NativeItemInfo& info) override;
    TrayResult UpdateItem(NativeHandle menu, const NativeItemInfo& info) override;
    TrayResult DeleteItem(NativeHandle menu, MenuItemId id) override;
    TrayResult RemoveItem(NativeHandle menu, MenuItemId id) override;
    TrayResult ShowPopup(NativeHandle menu) override;

    TrayResult LoadIconFromFile(const std::string& path, NativeHandle& out) override;
    TrayResult LoadIconFromBytes(const std::vector<uint8_t>& bytes, NativeHandle& out) override;
    TrayResult IconToMenuBitmap(NativeHandle icon, NativeHandle& out) override;

    PumpResult PumpMessage() override;
    void PostClose() override;
    void PostQuit(int exitCode) override;

private:
    static LRESULT CALLBACK WndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam);
    LRESULT HandleMessage(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam);
    TrayEvent Translate(UINT msg, WPARAM wParam, LPARAM lParam) const;

    void FillNotifyData(NOTIFYICONDATAW& nid, UINT flags) const;
    static MENUITEMINFOW BuildItemInfo(const NativeItemInfo& info, std::wstring& titleBuf);

    std::atomic<HWND> m_hwnd{nullptr};
    std::atomic<bool> m_destroying{false};
    DWORD m_threadId = 0;
    HINSTANCE m_hInstance = nullptr;
    TrayEventSink* m_sink = nullptr;
    UINT m_callbackMsg = WM_USER + 1;
    UINT m_taskbarCreatedMsg = 0;
    bool m_classRegistered = false;
};

// Convenience for applications that want the default backend.
std::unique_ptr<NativeMenuSurface> CreateWin32Surface();

#endif // _WIN32

#endif // TRAYKIT_WIN32_SURFACE_H
