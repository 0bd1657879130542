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

#ifdef _WIN32

#include "win32_surface.h"
#include "constants.h"
#include "logger.h"
#include "utils.h"
#include <shellapi.h>
#include <string>

namespace {

TrayResult LastError(const char* call)
{
    return TrayResult::Fail(TrayError::NativeCallFailed,
                            std::string(call) + " failed (error " + std::to_string(GetLastError()) + ")");
}

HMENU AsMenu(NativeHandle h) { return reinterpret_cast<HMENU>(h); }
HICON AsIcon(NativeHandle h) { return reinterpret_cast<HICON>(h); }

template <typename T>
NativeHandle AsHandle(T h) { return reinterpret_cast<NativeHandle>(h); }

} // namespace

std::unique_ptr<NativeMenuSurface> CreateWin32Surface()
{
    return std::make_unique<Win32MenuSurface>();
}

Win32MenuSurface::~Win32MenuSurface()
{
    // The sink may already be gone; late window messages go to DefWindowProc
    m_sink = nullptr;
    if (m_hwnd.load()) UnregisterWindow();
}

// ---------------------------------------------------------------------------
// Window
// ---------------------------------------------------------------------------

TrayResult Win32MenuSurface::RegisterWindow(TrayEventSink* sink)
{
    if (!sink) return TrayResult::Fail(TrayError::InvalidArgument, "no event sink");

    m_sink = sink;
    m_hInstance = GetModuleHandleW(nullptr);
    m_threadId = GetCurrentThreadId();
    m_callbackMsg = WM_USER + TRAY_CALLBACK_OFFSET;

    // Sent to all top-level windows when Explorer restarts
    m_taskbarCreatedMsg = RegisterWindowMessageW(TASKBAR_CREATED_MSG);
    if (m_taskbarCreatedMsg == 0) return LastError("RegisterWindowMessageW");

    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(WNDCLASSEXW);
    wc.lpfnWndProc = WndProc;
    wc.hInstance = m_hInstance;
    wc.hIcon = LoadIconW(nullptr, IDI_APPLICATION);
    wc.hCursor = LoadCursorW(nullptr, IDC_ARROW);
    wc.hbrBackground = reinterpret_cast<HBRUSH>(COLOR_WINDOW + 1);
    wc.lpszClassName = TRAY_WINDOW_CLASS;

    if (!RegisterClassExW(&wc))
    {
        if (GetLastError() != ERROR_CLASS_ALREADY_EXISTS) return LastError("RegisterClassExW");
    }
    else
    {
        m_classRegistered = true;
    }

    HWND hwnd = CreateWindowExW(0, TRAY_WINDOW_CLASS, L"", WS_OVERLAPPEDWINDOW,
                                CW_USEDEFAULT, CW_USEDEFAULT, CW_USEDEFAULT, CW_USEDEFAULT,
                                nullptr, nullptr, m_hInstance, this);
    if (!hwnd)
    {
        TrayResult r = LastError("CreateWindowExW");
        if (m_classRegistered)
        {
            UnregisterClassW(TRAY_WINDOW_CLASS, m_hInstance);
            m_classRegistered = false;
        }
        return r;
    }

    m_hwnd.store(hwnd);
    ShowWindow(hwnd, SW_HIDE);
    UpdateWindow(hwnd);
    return TrayResult::Ok();
}

void Win32MenuSurface::UnregisterWindow()
{
    HWND hwnd = m_hwnd.load();
    if (hwnd && !m_destroying.exchange(true))
    {
        // WM_DESTROY reaches the sink before this returns, with m_hwnd still
        // valid so the tray icon can be deleted. WM_NCDESTROY clears it.
        if (!DestroyWindow(hwnd))
            Log("[TRAY] DestroyWindow failed (error " + std::to_string(GetLastError()) + ")");
        m_hwnd.store(nullptr);
        m_destroying.store(false);
    }
    if (m_classRegistered)
    {
        UnregisterClassW(TRAY_WINDOW_CLASS, m_hInstance);
        m_classRegistered = false;
    }
}

LRESULT CALLBACK Win32MenuSurface::WndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    Win32MenuSurface* self = nullptr;

    if (msg == WM_NCCREATE)
    {
        auto* cs = reinterpret_cast<CREATESTRUCTW*>(lParam);
        self = static_cast<Win32MenuSurface*>(cs->lpCreateParams);
        SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(self));
    }
    else
    {
        self = reinterpret_cast<Win32MenuSurface*>(GetWindowLongPtrW(hwnd, GWLP_USERDATA));
    }

    if (self) return self->HandleMessage(hwnd, msg, wParam, lParam);
    return DefWindowProcW(hwnd, msg, wParam, lParam);
}

LRESULT Win32MenuSurface::HandleMessage(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam)
{
    if (msg == WM_NCDESTROY)
    {
        SetWindowLongPtrW(hwnd, GWLP_USERDATA, 0);
        m_hwnd.store(nullptr);
        return DefWindowProcW(hwnd, msg, wParam, lParam);
    }

    TrayEvent ev = Translate(msg, wParam, lParam);
    if (ev.kind != TrayEventKind::Unrecognized && m_sink && m_sink->OnTrayEvent(ev))
        return 0;

    return DefWindowProcW(hwnd, msg, wParam, lParam);
}

TrayEvent Win32MenuSurface::Translate(UINT msg, WPARAM wParam, LPARAM lParam) const
{
    TrayEvent ev;

    if (msg == m_callbackMsg)
    {
        ev.kind = TrayEventKind::TrayIconClick;
        switch (LOWORD(lParam))
        {
        case WM_LBUTTONUP: ev.button = TrayMouseButton::Left; break;
        case WM_RBUTTONUP: ev.button = TrayMouseButton::Right; break;
        default: ev.button = TrayMouseButton::None; break;
        }
        return ev;
    }
    if (m_taskbarCreatedMsg != 0 && msg == m_taskbarCreatedMsg)
    {
        ev.kind = TrayEventKind::TaskbarCreated;
        return ev;
    }

    switch (msg)
    {
    case WM_COMMAND:
        // lParam is zero for menu commands; -1 is not an item
        if (lParam == 0 && static_cast<int32_t>(wParam) != -1)
        {
            ev.kind = TrayEventKind::ItemActivated;
            ev.itemId = static_cast<MenuItemId>(wParam);
        }
        break;
    case WM_CLOSE:      ev.kind = TrayEventKind::Close; break;
    case WM_DESTROY:    ev.kind = TrayEventKind::Destroy; break;
    case WM_ENDSESSION: ev.kind = TrayEventKind::EndSession; break;
    default: break;
    }
    return ev;
}

// ---------------------------------------------------------------------------
// Notification area
// ---------------------------------------------------------------------------

void Win32MenuSurface::FillNotifyData(NOTIFYICONDATAW& nid, UINT flags) const
{
    ZeroMemory(&nid, sizeof(nid));
    nid.cbSize = sizeof(NOTIFYICONDATAW);
    nid.hWnd = m_hwnd.load();
    nid.uID = TRAY_ICON_UID;
    nid.uFlags = flags;
}

TrayResult Win32MenuSurface::AddTrayIcon()
{
    NOTIFYICONDATAW nid;
    FillNotifyData(nid, NIF_MESSAGE);
    nid.uCallbackMessage = m_callbackMsg;

    if (!Shell_NotifyIconW(NIM_ADD, &nid)) return LastError("Shell_NotifyIconW(NIM_ADD)");
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::SetTrayIcon(NativeHandle icon)
{
    NOTIFYICONDATAW nid;
    FillNotifyData(nid, NIF_ICON);
    nid.hIcon = AsIcon(icon);

    if (!Shell_NotifyIconW(NIM_MODIFY, &nid)) return LastError("Shell_NotifyIconW(NIM_MODIFY)");
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::SetTrayTooltip(const std::string& text)
{
    NOTIFYICONDATAW nid;
    FillNotifyData(nid, NIF_TIP);

    // szTip is fixed size; longer text is truncated
    std::wstring tip = Utf8ToWide(text);
    size_t len = tip.copy(nid.szTip, TRAY_TOOLTIP_MAX);
    // Never end on the first half of a surrogate pair
    if (len > 0 && len < tip.size() && IS_HIGH_SURROGATE(nid.szTip[len - 1])) --len;
    nid.szTip[len] = L'\0';

    if (!Shell_NotifyIconW(NIM_MODIFY, &nid)) return LastError("Shell_NotifyIconW(NIM_MODIFY)");
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::DeleteTrayIcon()
{
    NOTIFYICONDATAW nid;
    FillNotifyData(nid, 0);

    if (!Shell_NotifyIconW(NIM_DELETE, &nid)) return LastError("Shell_NotifyIconW(NIM_DELETE)");
    return TrayResult::Ok();
}

// ---------------------------------------------------------------------------
// Menus
// ---------------------------------------------------------------------------

TrayResult Win32MenuSurface::CreateRootMenu(NativeHandle& out)
{
    HMENU menu = CreatePopupMenu();
    if (!menu) return LastError("CreatePopupMenu");

    MENUINFO mi = {};
    mi.cbSize = sizeof(MENUINFO);
    mi.fMask = MIM_APPLYTOSUBMENUS;
    if (!SetMenuInfo(menu, &mi))
    {
        TrayResult r = LastError("SetMenuInfo");
        ::DestroyMenu(menu);
        return r;
    }

    out = AsHandle(menu);
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::CreateSubMenu(NativeHandle& out)
{
    HMENU menu = CreateMenu();
    if (!menu) return LastError("CreateMenu");

    out = AsHandle(menu);
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::AttachSubMenu(NativeHandle menu, MenuItemId itemId, NativeHandle submenu)
{
    MENUITEMINFOW mii = {};
    mii.cbSize = sizeof(MENUITEMINFOW);
    mii.fMask = MIIM_SUBMENU;
    mii.hSubMenu = AsMenu(submenu);

    if (!SetMenuItemInfoW(AsMenu(menu), itemId, FALSE, &mii)) return LastError("SetMenuItemInfoW");
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::DestroyMenu(NativeHandle menu)
{
    if (!::DestroyMenu(AsMenu(menu))) return LastError("DestroyMenu");
    return TrayResult::Ok();
}

MENUITEMINFOW Win32MenuSurface::BuildItemInfo(const NativeItemInfo& info, std::wstring& titleBuf)
{
    MENUITEMINFOW mii = {};
    mii.cbSize = sizeof(MENUITEMINFOW);
    mii.wID = info.id;

    if (info.separator)
    {
        mii.fMask = MIIM_FTYPE | MIIM_ID | MIIM_STATE;
        mii.fType = MFT_SEPARATOR;
        return mii;
    }

    titleBuf = Utf8ToWide(info.title);
    mii.fMask = MIIM_FTYPE | MIIM_STRING | MIIM_ID | MIIM_STATE;
    mii.fType = MFT_STRING;
    mii.dwTypeData = titleBuf.data();
    mii.cch = static_cast<UINT>(titleBuf.size());

    if (info.disabled) mii.fState |= MFS_DISABLED;
    if (info.checked)  mii.fState |= MFS_CHECKED;

    if (info.bitmap != NULL_HANDLE)
    {
        mii.fMask |= MIIM_BITMAP;
        mii.hbmpItem = reinterpret_cast<HBITMAP>(info.bitmap);
    }
    if (info.submenu != NULL_HANDLE)
    {
        mii.fMask |= MIIM_SUBMENU;
        mii.hSubMenu = AsMenu(info.submenu);
    }
    return mii;
}

TrayResult Win32MenuSurface::InsertItem(NativeHandle menu, int position, const NativeItemInfo& info)
{
    std::wstring title;
    MENUITEMINFOW mii = BuildItemInfo(info, title);

    if (!InsertMenuItemW(AsMenu(menu), static_cast<UINT>(position), TRUE, &mii))
        return LastError("InsertMenuItemW");
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::UpdateItem(NativeHandle menu, const NativeItemInfo& info)
{
    std::wstring title;
    MENUITEMINFOW mii = BuildItemInfo(info, title);

    if (!SetMenuItemInfoW(AsMenu(menu), info.id, FALSE, &mii)) return LastError("SetMenuItemInfoW");
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::DeleteItem(NativeHandle menu, MenuItemId id)
{
    if (!DeleteMenu(AsMenu(menu), id, MF_BYCOMMAND)) return LastError("DeleteMenu");
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::RemoveItem(NativeHandle menu, MenuItemId id)
{
    if (!RemoveMenu(AsMenu(menu), id, MF_BYCOMMAND)) return LastError("RemoveMenu");
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::ShowPopup(NativeHandle menu)
{
    HWND hwnd = m_hwnd.load();
    if (!hwnd) return TrayResult::Fail(TrayError::NotReady, "window not registered");

    POINT pt;
    if (!GetCursorPos(&pt)) return LastError("GetCursorPos");

    // Without this the menu does not close when the user clicks elsewhere
    SetForegroundWindow(hwnd);

    if (!TrackPopupMenu(AsMenu(menu), TPM_BOTTOMALIGN | TPM_LEFTALIGN, pt.x, pt.y, 0, hwnd, nullptr))
        return LastError("TrackPopupMenu");

    PostMessageW(hwnd, WM_NULL, 0, 0);
    return TrayResult::Ok();
}

// ---------------------------------------------------------------------------
// Icons
// ---------------------------------------------------------------------------

TrayResult Win32MenuSurface::LoadIconFromFile(const std::string& path, NativeHandle& out)
{
    std::wstring wpath = Utf8ToWide(path);
    HANDLE h = LoadImageW(nullptr, wpath.c_str(), IMAGE_ICON, 0, 0, LR_LOADFROMFILE | LR_DEFAULTSIZE);
    if (!h) return LastError("LoadImageW");

    out = AsHandle(h);
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::LoadIconFromBytes(const std::vector<uint8_t>& bytes, NativeHandle& out)
{
    if (bytes.empty()) return TrayResult::Fail(TrayError::InvalidArgument, "empty icon data");

    // The directory lookup wants a mutable buffer
    std::vector<BYTE> data(bytes.begin(), bytes.end());

    int offset = LookupIconIdFromDirectoryEx(data.data(), TRUE, 0, 0, LR_DEFAULTCOLOR);
    if (offset <= 0 || static_cast<size_t>(offset) >= data.size())
        return TrayResult::Fail(TrayError::InvalidArgument, "not an .ico image");

    HICON icon = CreateIconFromResourceEx(data.data() + offset, static_cast<DWORD>(data.size() - offset),
                                          TRUE, 0x00030000, 0, 0, LR_DEFAULTCOLOR | LR_DEFAULTSIZE);
    if (!icon) return LastError("CreateIconFromResourceEx");

    out = AsHandle(icon);
    return TrayResult::Ok();
}

TrayResult Win32MenuSurface::IconToMenuBitmap(NativeHandle icon, NativeHandle& out)
{
    HDC screen = GetDC(nullptr);
    if (!screen) return LastError("GetDC");

    HDC memDC = CreateCompatibleDC(screen);
    if (!memDC)
    {
        TrayResult r = LastError("CreateCompatibleDC");
        ReleaseDC(nullptr, screen);
        return r;
    }

    int cx = GetSystemMetrics(SM_CXSMICON);
    int cy = GetSystemMetrics(SM_CYSMICON);

    BITMAPINFO bmi = {};
    bmi.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
    bmi.bmiHeader.biWidth = cx;
    bmi.bmiHeader.biHeight = cy;
    bmi.bmiHeader.biPlanes = 1;
    bmi.bmiHeader.biBitCount = 32;
    bmi.bmiHeader.biCompression = BI_RGB;

    void* bits = nullptr;
    HBITMAP bitmap = CreateDIBSection(memDC, &bmi, DIB_RGB_COLORS, &bits, nullptr, 0);

    TrayResult r = TrayResult::Ok();
    if (!bitmap)
    {
        r = LastError("CreateDIBSection");
    }
    else
    {
        HGDIOBJ previous = SelectObject(memDC, bitmap);
        if (!DrawIconEx(memDC, 0, 0, AsIcon(icon), cx, cy, 0, nullptr, DI_NORMAL))
            r = LastError("DrawIconEx");
        SelectObject(memDC, previous);

        if (r.ok())
            out = AsHandle(bitmap);
        else
            DeleteObject(bitmap);
    }

    DeleteDC(memDC);
    ReleaseDC(nullptr, screen);
    return r;
}

// ---------------------------------------------------------------------------
// Message pump
// ---------------------------------------------------------------------------

PumpResult Win32MenuSurface::PumpMessage()
{
    MSG msg;
    BOOL ret = GetMessageW(&msg, nullptr, 0, 0);
    if (ret == -1) return PumpResult::Failed;
    if (ret == 0) return PumpResult::Quit;

    TranslateMessage(&msg);
    DispatchMessageW(&msg);
    return PumpResult::Dispatched;
}

void Win32MenuSurface::PostClose()
{
    HWND hwnd = m_hwnd.load();
    if (hwnd) PostMessageW(hwnd, WM_CLOSE, 0, 0);
}

void Win32MenuSurface::PostQuit(int exitCode)
{
    if (m_threadId == 0 || GetCurrentThreadId() == m_threadId)
        PostQuitMessage(exitCode);
    else
        PostThreadMessageW(m_threadId, WM_QUIT, static_cast<WPARAM>(exitCode), 0);
}

#endif // _WIN32
