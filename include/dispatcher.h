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

#ifndef TRAYKIT_DISPATCHER_H
#define TRAYKIT_DISPATCHER_H

#include "types.h"
#include "native_surface.h"
#include "menu_registry.h"
#include "menu_sync.h"
#include "tray_icon.h"
#include "worker_thread.h"
#include "one_shot.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <vector>

enum class DispatcherState { Uninitialized, Ready, Closing, Terminated };

const char* DispatcherStateName(DispatcherState state);

// Owns the native message pump. Every event is handled on the pumping thread;
// click callbacks are handed to the worker pool so slow user code never
// stalls the pump.
class EventDispatcher : public TrayEventSink {
public:
    EventDispatcher(NativeMenuSurface& surface, MenuRegistry& registry, MenuSync& sync,
                    TrayIcon& trayIcon, WorkerPool& pool);

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    bool OnTrayEvent(const TrayEvent& ev) override;

    // Pumps until the loop quits (Ok) or fails (PumpFailed).
    TrayResult Run();

    void MarkReady();
    DispatcherState State() const { return m_state.load(std::memory_order_acquire); }

    // Must be set before the pump starts.
    void SetExitHandler(std::function<void()> onExit);

    // Quit request from any thread: posts a close to the pump, drops the tray
    // icon and fires the exit handler (once across all paths).
    void RequestClose();
    bool ExitFired() const { return m_exitGate.Fired(); }

    // Open policy and observers
    void OnTrayOpened(std::function<void()> fn);
    void SetOpenOnLeftClick(bool open)  { m_openOnLeft.store(open); }
    void SetOpenOnRightClick(bool open) { m_openOnRight.store(open); }
    bool OpensOnLeftClick() const  { return m_openOnLeft.load(); }
    bool OpensOnRightClick() const { return m_openOnRight.load(); }

private:
    void HandleItemActivated(MenuItemId id);
    void HandleTrayClick(TrayMouseButton button);
    void HandleClose();
    void HandleExit();
    void FireExit();

    NativeMenuSurface& m_surface;
    MenuRegistry& m_registry;
    MenuSync& m_sync;
    TrayIcon& m_trayIcon;
    WorkerPool& m_pool;

    std::atomic<DispatcherState> m_state{DispatcherState::Uninitialized};

    std::function<void()> m_onExit;
    OneShot m_exitGate;

    std::mutex m_observerMtx;
    std::vector<std::function<void()>> m_openedObservers;

    std::atomic<bool> m_openOnLeft{true};
    std::atomic<bool> m_openOnRight{true};
};

#endif // TRAYKIT_DISPATCHER_H
