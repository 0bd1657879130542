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

#ifndef TRAYKIT_TESTS_FAKE_SURFACE_H
#define TRAYKIT_TESTS_FAKE_SURFACE_H

#include "native_surface.h"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// In-memory stand-in for the OS menu widgets. Menus are ordered lists of
// item infos; the message queue is a blocking deque drained by PumpMessage.
// Any method named in Fail() returns NativeCallFailed until Heal().
// DeleteItem named in Hold() parks its caller until Release().
// Like a real window, the tray icon can only be deleted while the window lives.
class FakeSurface : public NativeMenuSurface {
public:
    struct Menu {
        bool root = false;
        std::vector<NativeItemInfo> entries;
    };

    // -- failure injection --------------------------------------------------
    void Fail(const std::string& call)
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_failing.insert(call);
    }
    void Heal(const std::string& call)
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_failing.erase(call);
    }

    // -- blocking injection ---------------------------------------------------
    void Hold(const std::string& call)
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_held.insert(call);
    }
    void Release(const std::string& call)
    {
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            m_held.erase(call);
        }
        m_holdCv.notify_all();
    }
    // Blocks until some thread is parked inside call.
    bool WaitParked(const std::string& call, std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(m_mtx);
        return m_holdCv.wait_for(lock, timeout, [&] { return m_parked.count(call) != 0; });
    }

    // -- window -------------------------------------------------------------
    TrayResult RegisterWindow(TrayEventSink* sink) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("RegisterWindow")) return Failed("RegisterWindow");
        m_sink = sink;
        m_registered = true;
        m_windowGone = false;
        return TrayResult::Ok();
    }

    void UnregisterWindow() override
    {
        TrayEventSink* sink = nullptr;
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            if (!m_registered || m_destroying) return;
            m_destroying = true;
            sink = m_sink;
        }
        // Destroying a window delivers its destroy message synchronously,
        // while the window still exists
        TrayEvent ev;
        ev.kind = TrayEventKind::Destroy;
        if (sink) sink->OnTrayEvent(ev);

        std::lock_guard<std::mutex> lock(m_mtx);
        m_registered = false;
        m_destroying = false;
        m_windowGone = true;
    }

    // -- notification area --------------------------------------------------
    TrayResult AddTrayIcon() override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("AddTrayIcon")) return Failed("AddTrayIcon");
        ++m_trayAdds;
        m_trayPresent = true;
        return TrayResult::Ok();
    }

    TrayResult SetTrayIcon(NativeHandle icon) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("SetTrayIcon")) return Failed("SetTrayIcon");
        m_trayIcon = icon;
        ++m_trayIconSets;
        return TrayResult::Ok();
    }

    TrayResult SetTrayTooltip(const std::string& text) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("SetTrayTooltip")) return Failed("SetTrayTooltip");
        m_trayTooltip = text;
        ++m_tooltipSets;
        return TrayResult::Ok();
    }

    TrayResult DeleteTrayIcon() override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("DeleteTrayIcon") || m_windowGone) return Failed("DeleteTrayIcon");
        ++m_trayDeletes;
        m_trayPresent = false;
        return TrayResult::Ok();
    }

    // -- menus ----------------------------------------------------------------
    TrayResult CreateRootMenu(NativeHandle& out) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("CreateRootMenu")) return Failed("CreateRootMenu");
        out = NewHandle();
        m_menus[out].root = true;
        return TrayResult::Ok();
    }

    TrayResult CreateSubMenu(NativeHandle& out) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("CreateSubMenu")) return Failed("CreateSubMenu");
        out = NewHandle();
        m_menus[out];
        return TrayResult::Ok();
    }

    TrayResult AttachSubMenu(NativeHandle menu, MenuItemId itemId, NativeHandle submenu) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("AttachSubMenu")) return Failed("AttachSubMenu");
        NativeItemInfo* entry = FindEntry(menu, itemId);
        if (!entry || !m_menus.count(submenu)) return Failed("AttachSubMenu");
        entry->submenu = submenu;
        return TrayResult::Ok();
    }

    TrayResult DestroyMenu(NativeHandle menu) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("DestroyMenu")) return Failed("DestroyMenu");
        if (!m_menus.count(menu)) return Failed("DestroyMenu");
        DestroyRecursive(menu);
        return TrayResult::Ok();
    }

    TrayResult InsertItem(NativeHandle menu, int position, const NativeItemInfo& info) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        ++m_inserts;
        m_lastInsertPosition = position;
        if (Failing("InsertItem")) return Failed("InsertItem");

        auto it = m_menus.find(menu);
        if (it == m_menus.end()) return Failed("InsertItem");
        auto& entries = it->second.entries;
        if (position < 0 || static_cast<size_t>(position) > entries.size()) return Failed("InsertItem");
        if (FindEntry(menu, info.id)) return Failed("InsertItem");

        entries.insert(entries.begin() + position, info);
        return TrayResult::Ok();
    }

    TrayResult UpdateItem(NativeHandle menu, const NativeItemInfo& info) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        ++m_updates;
        if (Failing("UpdateItem")) return Failed("UpdateItem");

        NativeItemInfo* entry = FindEntry(menu, info.id);
        if (!entry) return Failed("UpdateItem");
        NativeHandle submenu = entry->submenu;
        *entry = info;
        entry->submenu = submenu;
        return TrayResult::Ok();
    }

    TrayResult DeleteItem(NativeHandle menu, MenuItemId id) override
    {
        Park("DeleteItem");
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("DeleteItem")) return Failed("DeleteItem");

        NativeItemInfo removed;
        if (!EraseEntry(menu, id, removed)) return Failed("DeleteItem");
        // Deleting an entry frees the submenu it opens
        if (removed.submenu != NULL_HANDLE && m_menus.count(removed.submenu))
            DestroyRecursive(removed.submenu);
        return TrayResult::Ok();
    }

    TrayResult RemoveItem(NativeHandle menu, MenuItemId id) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("RemoveItem")) return Failed("RemoveItem");

        NativeItemInfo removed;
        if (!EraseEntry(menu, id, removed)) return Failed("RemoveItem");
        return TrayResult::Ok();
    }

    TrayResult ShowPopup(NativeHandle menu) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("ShowPopup")) return Failed("ShowPopup");
        if (!m_menus.count(menu)) return Failed("ShowPopup");
        ++m_popups;
        return TrayResult::Ok();
    }

    // -- icons ----------------------------------------------------------------
    TrayResult LoadIconFromFile(const std::string& path, NativeHandle& out) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        ++m_fileLoads;
        if (Failing("LoadIconFromFile")) return Failed("LoadIconFromFile");
        out = NewHandle();
        m_iconSources[out] = path;
        return TrayResult::Ok();
    }

    TrayResult LoadIconFromBytes(const std::vector<uint8_t>& bytes, NativeHandle& out) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        ++m_byteLoads;
        if (Failing("LoadIconFromBytes")) return Failed("LoadIconFromBytes");
        out = NewHandle();
        m_iconSources[out] = std::string(bytes.begin(), bytes.end());
        return TrayResult::Ok();
    }

    TrayResult IconToMenuBitmap(NativeHandle icon, NativeHandle& out) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (Failing("IconToMenuBitmap")) return Failed("IconToMenuBitmap");
        if (!m_iconSources.count(icon)) return Failed("IconToMenuBitmap");
        out = NewHandle();
        return TrayResult::Ok();
    }

    // -- message pump ---------------------------------------------------------
    PumpResult PumpMessage() override
    {
        Message msg;
        TrayEventSink* sink = nullptr;
        {
            std::unique_lock<std::mutex> lock(m_mtx);
            m_queueCv.wait(lock, [this] { return !m_queue.empty() || m_pumpBroken; });
            if (m_pumpBroken) return PumpResult::Failed;

            msg = m_queue.front();
            m_queue.pop_front();
            if (msg.type == Message::Quit) return PumpResult::Quit;
            sink = m_sink;
        }

        if (msg.type == Message::Event && sink)
            sink->OnTrayEvent(msg.event);

        {
            std::lock_guard<std::mutex> lock(m_mtx);
            ++m_handled;
        }
        m_handledCv.notify_all();
        return PumpResult::Dispatched;
    }

    void PostClose() override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (!m_registered) return;
        TrayEvent ev;
        ev.kind = TrayEventKind::Close;
        Enqueue(Message{Message::Event, ev});
    }

    void PostQuit(int exitCode) override
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_exitCode = exitCode;
        Enqueue(Message{Message::Quit, {}});
    }

    // -- test helpers ---------------------------------------------------------

    // Queues an event for the pump thread.
    void Inject(const TrayEvent& ev)
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        Enqueue(Message{Message::Event, ev});
    }

    void InjectClick(MenuItemId id)
    {
        TrayEvent ev;
        ev.kind = TrayEventKind::ItemActivated;
        ev.itemId = id;
        Inject(ev);
    }

    void InjectTrayClick(TrayMouseButton button)
    {
        TrayEvent ev;
        ev.kind = TrayEventKind::TrayIconClick;
        ev.button = button;
        Inject(ev);
    }

    // Blocks until everything queued so far went through the sink.
    bool Flush(std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(m_mtx);
        uint64_t target = m_enqueued;
        return m_handledCv.wait_for(lock, timeout, [&] { return m_handled >= target; });
    }

    void BreakPump()
    {
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            m_pumpBroken = true;
        }
        m_queueCv.notify_all();
    }

    std::vector<MenuItemId> ItemsIn(NativeHandle menu) const
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        std::vector<MenuItemId> ids;
        auto it = m_menus.find(menu);
        if (it == m_menus.end()) return ids;
        for (const auto& e : it->second.entries) ids.push_back(e.id);
        return ids;
    }

    bool Entry(NativeHandle menu, MenuItemId id, NativeItemInfo& out) const
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        auto it = m_menus.find(menu);
        if (it == m_menus.end()) return false;
        for (const auto& e : it->second.entries)
        {
            if (e.id == id)
            {
                out = e;
                return true;
            }
        }
        return false;
    }

    bool MenuExists(NativeHandle menu) const
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        return m_menus.count(menu) != 0;
    }

    size_t MenuCount() const
    {
        std::lock_guard<std::mutex> lock(m_mtx);
        return m_menus.size();
    }

    bool IsRegistered() const { std::lock_guard<std::mutex> lock(m_mtx); return m_registered; }
    bool TrayPresent() const  { std::lock_guard<std::mutex> lock(m_mtx); return m_trayPresent; }
    NativeHandle TrayIconHandle() const { std::lock_guard<std::mutex> lock(m_mtx); return m_trayIcon; }
    std::string TrayTooltip() const { std::lock_guard<std::mutex> lock(m_mtx); return m_trayTooltip; }
    int TrayAdds() const      { std::lock_guard<std::mutex> lock(m_mtx); return m_trayAdds; }
    int TrayDeletes() const   { std::lock_guard<std::mutex> lock(m_mtx); return m_trayDeletes; }
    int TrayIconSets() const  { std::lock_guard<std::mutex> lock(m_mtx); return m_trayIconSets; }
    int TooltipSets() const   { std::lock_guard<std::mutex> lock(m_mtx); return m_tooltipSets; }
    int Popups() const        { std::lock_guard<std::mutex> lock(m_mtx); return m_popups; }
    int Inserts() const       { std::lock_guard<std::mutex> lock(m_mtx); return m_inserts; }
    int Updates() const       { std::lock_guard<std::mutex> lock(m_mtx); return m_updates; }
    int LastInsertPosition() const { std::lock_guard<std::mutex> lock(m_mtx); return m_lastInsertPosition; }
    int FileLoads() const     { std::lock_guard<std::mutex> lock(m_mtx); return m_fileLoads; }
    int ByteLoads() const     { std::lock_guard<std::mutex> lock(m_mtx); return m_byteLoads; }
    int ExitCode() const      { std::lock_guard<std::mutex> lock(m_mtx); return m_exitCode; }

private:
    struct Message {
        enum Type { Event, Quit } type = Event;
        TrayEvent event;
    };

    // Takes m_mtx itself
    void Park(const std::string& call)
    {
        std::unique_lock<std::mutex> lock(m_mtx);
        if (m_held.count(call) == 0) return;
        m_parked.insert(call);
        m_holdCv.notify_all();
        m_holdCv.wait(lock, [&] { return m_held.count(call) == 0; });
        m_parked.erase(m_parked.find(call));
    }

    // m_mtx must be held by the caller for every helper below
    bool Failing(const std::string& call) const { return m_failing.count(call) != 0; }

    static TrayResult Failed(const std::string& call)
    {
        return TrayResult::Fail(TrayError::NativeCallFailed, call + " failed");
    }

    NativeHandle NewHandle() { return m_nextHandle++; }

    void Enqueue(const Message& msg)
    {
        m_queue.push_back(msg);
        // Quit never reaches the handled counter
        if (msg.type == Message::Event) ++m_enqueued;
        m_queueCv.notify_one();
    }

    NativeItemInfo* FindEntry(NativeHandle menu, MenuItemId id)
    {
        auto it = m_menus.find(menu);
        if (it == m_menus.end()) return nullptr;
        for (auto& e : it->second.entries)
            if (e.id == id) return &e;
        return nullptr;
    }

    bool EraseEntry(NativeHandle menu, MenuItemId id, NativeItemInfo& removed)
    {
        auto it = m_menus.find(menu);
        if (it == m_menus.end()) return false;
        auto& entries = it->second.entries;
        auto pos = std::find_if(entries.begin(), entries.end(),
                                [id](const NativeItemInfo& e) { return e.id == id; });
        if (pos == entries.end()) return false;
        removed = *pos;
        entries.erase(pos);
        return true;
    }

    void DestroyRecursive(NativeHandle menu)
    {
        auto it = m_menus.find(menu);
        if (it == m_menus.end()) return;
        std::vector<NativeHandle> children;
        for (const auto& e : it->second.entries)
            if (e.submenu != NULL_HANDLE) children.push_back(e.submenu);
        m_menus.erase(it);
        for (NativeHandle child : children) DestroyRecursive(child);
    }

    mutable std::mutex m_mtx;
    std::condition_variable m_queueCv;
    std::condition_variable m_handledCv;
    std::deque<Message> m_queue;
    uint64_t m_enqueued = 0;
    uint64_t m_handled = 0;
    bool m_pumpBroken = false;
    int m_exitCode = -1;

    std::set<std::string> m_failing;
    std::set<std::string> m_held;
    std::multiset<std::string> m_parked;
    std::condition_variable m_holdCv;
    TrayEventSink* m_sink = nullptr;
    bool m_registered = false;
    bool m_destroying = false;
    bool m_windowGone = false;

    NativeHandle m_nextHandle = 0x1000;
    std::map<NativeHandle, Menu> m_menus;
    std::map<NativeHandle, std::string> m_iconSources;

    bool m_trayPresent = false;
    NativeHandle m_trayIcon = NULL_HANDLE;
    std::string m_trayTooltip;
    int m_trayAdds = 0;
    int m_trayDeletes = 0;
    int m_trayIconSets = 0;
    int m_tooltipSets = 0;

    int m_popups = 0;
    int m_inserts = 0;
    int m_updates = 0;
    int m_lastInsertPosition = -1;
    int m_fileLoads = 0;
    int m_byteLoads = 0;
};

#endif // TRAYKIT_TESTS_FAKE_SURFACE_H
