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

#include "dispatcher.h"
#include "logger.h"
#include <string>

const char* DispatcherStateName(DispatcherState state)
{
    switch (state)
    {
    case DispatcherState::Uninitialized: return "Uninitialized";
    case DispatcherState::Ready:         return "Ready";
    case DispatcherState::Closing:       return "Closing";
    case DispatcherState::Terminated:    return "Terminated";
    }
    return "Unknown";
}

EventDispatcher::EventDispatcher(NativeMenuSurface& surface, MenuRegistry& registry, MenuSync& sync,
                                 TrayIcon& trayIcon, WorkerPool& pool)
    : m_surface(surface), m_registry(registry), m_sync(sync), m_trayIcon(trayIcon), m_pool(pool)
{
}

void EventDispatcher::MarkReady()
{
    DispatcherState expected = DispatcherState::Uninitialized;
    m_state.compare_exchange_strong(expected, DispatcherState::Ready);
}

void EventDispatcher::SetExitHandler(std::function<void()> onExit)
{
    m_onExit = std::move(onExit);
}

void EventDispatcher::OnTrayOpened(std::function<void()> fn)
{
    if (!fn) return;
    std::lock_guard<std::mutex> lock(m_observerMtx);
    m_openedObservers.push_back(std::move(fn));
}

TrayResult EventDispatcher::Run()
{
    while (true)
    {
        switch (m_surface.PumpMessage())
        {
        case PumpResult::Dispatched:
            continue;

        case PumpResult::Quit:
            m_state.store(DispatcherState::Terminated, std::memory_order_release);
            return TrayResult::Ok();

        case PumpResult::Failed:
            Log("[PUMP] Message loop failure, ending tray session.");
            m_state.store(DispatcherState::Terminated, std::memory_order_release);
            return TrayResult::Fail(TrayError::PumpFailed, "message loop failure");
        }
    }
}

bool EventDispatcher::OnTrayEvent(const TrayEvent& ev)
{
    switch (ev.kind)
    {
    case TrayEventKind::ItemActivated:
        HandleItemActivated(ev.itemId);
        return true;

    case TrayEventKind::TrayIconClick:
        HandleTrayClick(ev.button);
        return true;

    case TrayEventKind::Close:
        HandleClose();
        return true;

    case TrayEventKind::Destroy:
        // Same as end of session, but also ends the message loop
        HandleExit();
        m_surface.PostQuit(0);
        return true;

    case TrayEventKind::EndSession:
        HandleExit();
        return true;

    case TrayEventKind::TaskbarCreated:
        m_trayIcon.OnTaskbarRestart();
        return true;

    case TrayEventKind::Unrecognized:
        break;
    }
    return false;
}

void EventDispatcher::HandleItemActivated(MenuItemId id)
{
    MenuItemRecord item;
    if (!m_registry.Find(id, item))
    {
        // Legitimate during a remove/click race
        Log("[TRAY] No menu item with ID " + std::to_string(id));
        return;
    }
    if (!item.onClick) return;

    if (!m_pool.Push(item.onClick))
    {
        Log("[TRAY] Dropped click on menu item " + std::to_string(id) + ": worker pool stopped.");
    }
}

void EventDispatcher::HandleTrayClick(TrayMouseButton button)
{
    bool accepted = (button == TrayMouseButton::Right && m_openOnRight.load()) ||
                    (button == TrayMouseButton::Left && m_openOnLeft.load());
    if (!accepted) return;

    std::vector<std::function<void()>> observers;
    {
        std::lock_guard<std::mutex> lock(m_observerMtx);
        observers = m_openedObservers;
    }
    for (const auto& fn : observers)
    {
        try
        {
            fn();
        }
        catch (const std::exception& e)
        {
            Log(std::string("[TRAY] Tray-opened observer threw an exception: ") + e.what());
        }
    }

    TrayResult r = m_sync.ShowPopup();
    if (!r.ok() && r.error != TrayError::NotReady)
    {
        Log("[TRAY] Failed to show menu: " + r.message);
    }
}

void EventDispatcher::HandleClose()
{
    DispatcherState current = m_state.load(std::memory_order_acquire);
    if (current != DispatcherState::Terminated)
        m_state.store(DispatcherState::Closing, std::memory_order_release);

    m_surface.UnregisterWindow();
}

void EventDispatcher::HandleExit()
{
    TrayResult r = m_trayIcon.Remove();
    if (!r.ok())
    {
        Log("[TRAY] Failed to delete tray icon: " + r.message);
    }
    FireExit();
}

void EventDispatcher::FireExit()
{
    m_exitGate.Run([this] {
        if (!m_onExit) return;
        try
        {
            m_onExit();
        }
        catch (const std::exception& e)
        {
            Log(std::string("[TRAY] Exit callback threw an exception: ") + e.what());
        }
    });
}

void EventDispatcher::RequestClose()
{
    DispatcherState current = m_state.load(std::memory_order_acquire);
    if (current == DispatcherState::Ready)
        m_state.compare_exchange_strong(current, DispatcherState::Closing);

    m_surface.PostClose();
    HandleExit();
}
