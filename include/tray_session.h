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

#ifndef TRAYKIT_TRAY_SESSION_H
#define TRAYKIT_TRAY_SESSION_H

#include "types.h"
#include "native_surface.h"
#include "id_allocator.h"
#include "menu_registry.h"
#include "menu_sync.h"
#include "icon_cache.h"
#include "tray_icon.h"
#include "worker_thread.h"
#include "dispatcher.h"
#include "one_shot.h"
#include "config.h"
#include "menu_item.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// One tray icon with its menu tree and message loop.
//
// Three ways to drive it:
//   Run()      registers and pumps on the calling thread until quit
//   Register() + RunLoop()  same thing split in two
//   Start()    pumps on an owned thread; Stop() quits and joins it
//
// onReady runs on a worker thread once the icon and root menu exist.
// onExit runs at most once, whatever ends the session.
//
// Stop() from a callback only requests the shutdown; threads are joined by
// the owner's next Stop() or by the destructor. The session must not be
// destroyed from one of its own callbacks.
class TraySession {
public:
    explicit TraySession(std::unique_ptr<NativeMenuSurface> surface);
    ~TraySession();

    TraySession(const TraySession&) = delete;
    TraySession& operator=(const TraySession&) = delete;

    // Run modes
    TrayResult Run(std::function<void()> onReady, std::function<void()> onExit);
    TrayResult Register(std::function<void()> onReady, std::function<void()> onExit);
    TrayResult RunLoop();
    TrayResult Start(std::function<void()> onReady, std::function<void()> onExit);
    void Stop();

    // Safe from any thread, any number of times.
    void Quit();

    // Removes every current item and rebuilds an empty root menu.
    void ResetMenu();

    bool IsReady() const { return m_initialized.load(std::memory_order_acquire); }
    DispatcherState State() const { return m_dispatcher.State(); }

    // Tray icon
    TrayResult SetIcon(const std::vector<uint8_t>& iconBytes);
    TrayResult SetIconFromFilePath(const std::string& iconFilePath);
    TrayResult SetTooltip(const std::string& tooltip);

    // Root menu
    MenuItem AddMenuItem(const std::string& title);
    TrayResult AddSeparator();

    // Popup policy
    void OnTrayOpened(std::function<void()> fn) { m_dispatcher.OnTrayOpened(std::move(fn)); }
    void SetOpenOnLeftClick(bool open)  { m_dispatcher.SetOpenOnLeftClick(open); }
    void SetOpenOnRightClick(bool open) { m_dispatcher.SetOpenOnRightClick(open); }

    // Click policy and log directory apply immediately; tooltip and icon
    // are deferred until the session is ready.
    TrayResult ApplyConfig(const TrayConfig& cfg);

    const MenuRegistry& Registry() const { return m_registry; }
    const MenuSync& Sync() const { return m_sync; }
    const IconCache& Icons() const { return m_icons; }
    const TrayIcon& Icon() const { return m_trayIcon; }

private:
    friend class MenuItem;

    // Item operations behind MenuItem
    MenuItem AddChild(MenuItemId parent, const std::string& title);
    TrayResult AddSeparatorTo(MenuItemId parent);
    void SetItemCallback(MenuItemId id, std::function<void()> onClick);
    TrayResult SetItemTitle(MenuItemId id, const std::string& title);
    TrayResult SetItemDisabled(MenuItemId id, bool disabled);
    TrayResult SetItemChecked(MenuItemId id, bool checked);
    TrayResult HideItem(MenuItemId id);
    TrayResult ShowItem(MenuItemId id);
    TrayResult RemoveItem(MenuItemId id);
    TrayResult SetItemIconFromBytes(MenuItemId id, const std::vector<uint8_t>& iconBytes);
    TrayResult SetItemIconFromFile(MenuItemId id, const std::string& iconFilePath);

    TrayResult SyncItem(const MenuItemRecord& rec);
    TrayResult ApplyItemIcon(MenuItemId id, const std::function<TrayResult(NativeHandle&)>& load);
    TrayResult ApplyVisualConfig(const TrayConfig& cfg);
    void SyncPendingItems();

    std::unique_ptr<NativeMenuSurface> m_surface;
    IdAllocator m_ids;
    MenuRegistry m_registry;
    MenuSync m_sync;
    IconCache m_icons;
    TrayIcon m_trayIcon;
    WorkerPool m_pool;
    EventDispatcher m_dispatcher;

    std::atomic<bool> m_initialized{false};
    OneShot m_quitGate;
    std::mutex m_resetMtx;

    std::mutex m_configMtx;
    bool m_hasPendingConfig = false;
    TrayConfig m_pendingConfig;

    std::thread m_loopThread;
};

#endif // TRAYKIT_TRAY_SESSION_H
