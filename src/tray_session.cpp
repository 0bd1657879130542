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

#include "tray_session.h"
#include "logger.h"
#include <future>

TraySession::TraySession(std::unique_ptr<NativeMenuSurface> surface)
    : m_surface(std::move(surface)),
      m_registry(m_ids),
      m_sync(*m_surface, &m_registry),
      m_icons(*m_surface),
      m_trayIcon(*m_surface),
      m_dispatcher(*m_surface, m_registry, m_sync, m_trayIcon, m_pool)
{
}

TraySession::~TraySession()
{
    Stop();

    // A loop that died without a close leaves the icon behind
    TrayResult r = m_trayIcon.Remove();
    if (!r.ok()) Log("[TRAY] Failed to delete tray icon: " + r.message);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TrayResult TraySession::Register(std::function<void()> onReady, std::function<void()> onExit)
{
    if (IsReady())
        return TrayResult::Fail(TrayError::InvalidArgument, "session already registered");
    if (m_quitGate.Fired() || m_dispatcher.ExitFired())
        return TrayResult::Fail(TrayError::InvalidArgument, "session already closed");

    m_pool.Start();

    TrayResult r = m_surface->RegisterWindow(&m_dispatcher);
    if (!r.ok())
    {
        Log("[TRAY] Unable to initialize tray: " + r.message);
        return TrayResult::Fail(r.error, "unable to initialize tray: " + r.message);
    }

    r = m_trayIcon.Add();
    if (!r.ok())
    {
        Log("[TRAY] Failed to create taskbar icon: " + r.message);
        m_surface->UnregisterWindow();
        return TrayResult::Fail(r.error, "failed to create taskbar icon: " + r.message);
    }

    r = m_sync.CreateRoot();
    if (!r.ok())
    {
        Log("[MENU] Unable to create menu: " + r.message);
        TrayResult removed = m_trayIcon.Remove();
        if (!removed.ok()) Log("[TRAY] Failed to delete tray icon: " + removed.message);
        m_surface->UnregisterWindow();
        return TrayResult::Fail(r.error, "unable to create menu: " + r.message);
    }

    // Installed only now so a failed registration never reports an exit
    m_dispatcher.SetExitHandler(std::move(onExit));
    m_initialized.store(true, std::memory_order_release);
    m_dispatcher.MarkReady();
    Log("[TRAY] Tray session ready.");

    // Items built before the window existed
    SyncPendingItems();

    TrayConfig pending;
    bool hasPending = false;
    {
        std::lock_guard<std::mutex> lock(m_configMtx);
        if (m_hasPendingConfig)
        {
            pending = m_pendingConfig;
            hasPending = true;
            m_hasPendingConfig = false;
        }
    }
    if (hasPending)
    {
        TrayResult applied = ApplyVisualConfig(pending);
        if (!applied.ok()) Log("[CONFIG] Failed to apply deferred settings: " + applied.message);
    }

    if (onReady && !m_pool.Push(std::move(onReady)))
        Log("[TRAY] Ready callback dropped: worker pool stopped.");

    return TrayResult::Ok();
}

TrayResult TraySession::RunLoop()
{
    if (!IsReady())
        return TrayResult::Fail(TrayError::NotReady, "session not registered");

    TrayResult r = m_dispatcher.Run();
    m_initialized.store(false, std::memory_order_release);
    Log(std::string("[TRAY] Message loop ended (") + DispatcherStateName(m_dispatcher.State()) + ").");
    return r;
}

TrayResult TraySession::Run(std::function<void()> onReady, std::function<void()> onExit)
{
    TrayResult r = Register(std::move(onReady), std::move(onExit));
    if (!r.ok()) return r;
    return RunLoop();
}

TrayResult TraySession::Start(std::function<void()> onReady, std::function<void()> onExit)
{
    if (m_loopThread.joinable())
        return TrayResult::Fail(TrayError::InvalidArgument, "session already started");

    // The window must be created on the thread that pumps its messages
    std::promise<TrayResult> registered;
    std::future<TrayResult> result = registered.get_future();

    // Callbacks may call Stop(), which reads m_loopThread
    std::promise<void> owned;
    std::shared_future<void> ownedFuture = owned.get_future().share();

    m_loopThread = std::thread(
        [this, onReady = std::move(onReady), onExit = std::move(onExit),
         registered = std::move(registered), ownedFuture]() mutable {
            ownedFuture.wait();
            TrayResult r = Register(std::move(onReady), std::move(onExit));
            bool ok = r.ok();
            registered.set_value(std::move(r));
            if (!ok) return;

            TrayResult loop = RunLoop();
            if (!loop.ok()) Log("[TRAY] Session thread exiting: " + loop.message);
        });
    owned.set_value();

    TrayResult r = result.get();
    if (!r.ok()) m_loopThread.join();
    return r;
}

void TraySession::Stop()
{
    Quit();

    // From the loop thread itself this only requests the close; the owner's
    // later Stop (or the destructor) joins
    if (m_loopThread.joinable() && m_loopThread.get_id() != std::this_thread::get_id())
        m_loopThread.join();
    m_pool.Stop();
}

void TraySession::Quit()
{
    // Nothing to close before registration or after the loop ended
    if (!IsReady()) return;

    m_quitGate.Run([this] { m_dispatcher.RequestClose(); });
}

void TraySession::ResetMenu()
{
    if (!IsReady()) return;

    std::lock_guard<std::mutex> lock(m_resetMtx);

    // Snapshot first: items added while the reset runs survive it
    for (MenuItemId id : m_registry.Ids())
    {
        if (!m_registry.Contains(id)) continue; // Went with an ancestor
        TrayResult r = RemoveItem(id);
        if (!r.ok() && r.error != TrayError::UnknownItem)
            Log("[MENU] Reset could not remove item " + std::to_string(id) + ": " + r.message);
    }

    TrayResult r = m_sync.DestroyRoot();
    if (!r.ok()) Log("[MENU] Failed to destroy root menu: " + r.message);

    m_sync.Clear();

    r = m_sync.CreateRoot();
    if (!r.ok())
    {
        Log("[MENU] Unable to create menu: " + r.message);
        return;
    }

    // Survivors lost their native entries with the old root
    SyncPendingItems();
}

// ---------------------------------------------------------------------------
// Tray icon
// ---------------------------------------------------------------------------

TrayResult TraySession::SetIcon(const std::vector<uint8_t>& iconBytes)
{
    if (!IsReady()) return TrayResult::Fail(TrayError::NotReady, "tray not ready");

    NativeHandle icon = NULL_HANDLE;
    TrayResult r = m_icons.LoadFromBytes(iconBytes, icon);
    if (!r.ok())
    {
        Log("[ICON] Unable to load icon from bytes: " + r.message);
        return r;
    }

    r = m_trayIcon.SetIcon(icon);
    if (!r.ok()) Log("[ICON] Unable to set icon: " + r.message);
    return r;
}

TrayResult TraySession::SetIconFromFilePath(const std::string& iconFilePath)
{
    if (!IsReady()) return TrayResult::Fail(TrayError::NotReady, "tray not ready");

    NativeHandle icon = NULL_HANDLE;
    TrayResult r = m_icons.LoadFromFile(iconFilePath, icon);
    if (!r.ok())
    {
        Log("[ICON] Unable to load icon " + iconFilePath + ": " + r.message);
        return r;
    }

    r = m_trayIcon.SetIcon(icon);
    if (!r.ok()) Log("[ICON] Unable to set icon: " + r.message);
    return r;
}

TrayResult TraySession::SetTooltip(const std::string& tooltip)
{
    if (!IsReady()) return TrayResult::Fail(TrayError::NotReady, "tray not ready");

    TrayResult r = m_trayIcon.UpdateTooltip(tooltip);
    if (!r.ok()) Log("[TRAY] Unable to set tooltip: " + r.message);
    return r;
}

TrayResult TraySession::ApplyConfig(const TrayConfig& cfg)
{
    if (!cfg.logDirectory.empty()) SetLogDirectory(cfg.logDirectory);

    m_dispatcher.SetOpenOnLeftClick(cfg.openOnLeftClick);
    m_dispatcher.SetOpenOnRightClick(cfg.openOnRightClick);

    if (!IsReady())
    {
        std::lock_guard<std::mutex> lock(m_configMtx);
        m_pendingConfig = cfg;
        m_hasPendingConfig = true;
        return TrayResult::Ok();
    }
    return ApplyVisualConfig(cfg);
}

TrayResult TraySession::ApplyVisualConfig(const TrayConfig& cfg)
{
    if (!cfg.tooltip.empty())
    {
        TrayResult r = SetTooltip(cfg.tooltip);
        if (!r.ok()) return r;
    }
    if (!cfg.iconPath.empty())
    {
        TrayResult r = SetIconFromFilePath(cfg.iconPath);
        if (!r.ok()) return r;
    }
    return TrayResult::Ok();
}

// ---------------------------------------------------------------------------
// Menu items
// ---------------------------------------------------------------------------

MenuItem TraySession::AddMenuItem(const std::string& title)
{
    return AddChild(ROOT_MENU_ID, title);
}

TrayResult TraySession::AddSeparator()
{
    return AddSeparatorTo(ROOT_MENU_ID);
}

MenuItem TraySession::AddChild(MenuItemId parent, const std::string& title)
{
    MenuItemRecord rec = m_registry.Create(title, parent);
    if (rec.id == 0)
    {
        Log("[MENU] Cannot add \"" + title + "\": no menu item with ID " + std::to_string(parent));
        return MenuItem();
    }
    // Before registration the record waits for SyncPendingItems
    SyncItem(rec);
    return MenuItem(this, rec.id);
}

TrayResult TraySession::AddSeparatorTo(MenuItemId parent)
{
    MenuItemRecord rec = m_registry.Create("", parent, true);
    if (rec.id == 0)
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(parent));
    return SyncItem(rec);
}

void TraySession::SetItemCallback(MenuItemId id, std::function<void()> onClick)
{
    m_registry.SetCallback(id, std::move(onClick));
}

TrayResult TraySession::SetItemTitle(MenuItemId id, const std::string& title)
{
    MenuItemRecord snapshot;
    if (!m_registry.SetTitle(id, title, &snapshot))
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(id));
    return SyncItem(snapshot);
}

TrayResult TraySession::SetItemDisabled(MenuItemId id, bool disabled)
{
    MenuItemRecord snapshot;
    if (!m_registry.SetDisabled(id, disabled, &snapshot))
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(id));
    return SyncItem(snapshot);
}

TrayResult TraySession::SetItemChecked(MenuItemId id, bool checked)
{
    MenuItemRecord snapshot;
    if (!m_registry.SetChecked(id, checked, &snapshot))
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(id));
    return SyncItem(snapshot);
}

TrayResult TraySession::HideItem(MenuItemId id)
{
    MenuItemRecord rec;
    if (!m_registry.Find(id, rec))
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(id));
    if (!IsReady()) return TrayResult::Fail(TrayError::NotReady, "tray not ready");

    TrayResult r = m_sync.Hide(rec.id, rec.parent);
    if (!r.ok()) Log("[MENU] Unable to hide menu item " + std::to_string(id) + ": " + r.message);
    return r;
}

TrayResult TraySession::ShowItem(MenuItemId id)
{
    MenuItemRecord rec;
    if (!m_registry.Find(id, rec))
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(id));
    return SyncItem(rec);
}

TrayResult TraySession::RemoveItem(MenuItemId id)
{
    if (!m_registry.Contains(id))
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(id));

    TrayResult first = TrayResult::Ok();
    m_registry.Remove(id, [this, &first](const MenuItemRecord& rec) {
        TrayResult r = m_sync.Delete(rec.id, rec.parent);
        if (r.ok()) return;

        Log("[MENU] Unable to delete menu item " + std::to_string(rec.id) + ": " + r.message);
        // The record goes regardless, so its bookkeeping must too
        m_sync.Forget(rec.id, rec.parent);
        if (first.ok()) first = r;
    });
    return first;
}

TrayResult TraySession::SetItemIconFromBytes(MenuItemId id, const std::vector<uint8_t>& iconBytes)
{
    return ApplyItemIcon(id, [this, &iconBytes](NativeHandle& out) {
        return m_icons.LoadFromBytes(iconBytes, out);
    });
}

TrayResult TraySession::SetItemIconFromFile(MenuItemId id, const std::string& iconFilePath)
{
    return ApplyItemIcon(id, [this, &iconFilePath](NativeHandle& out) {
        return m_icons.LoadFromFile(iconFilePath, out);
    });
}

TrayResult TraySession::ApplyItemIcon(MenuItemId id, const std::function<TrayResult(NativeHandle&)>& load)
{
    MenuItemRecord rec;
    if (!m_registry.Find(id, rec))
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(id));
    if (!IsReady()) return TrayResult::Fail(TrayError::NotReady, "tray not ready");

    NativeHandle icon = NULL_HANDLE;
    TrayResult r = load(icon);
    if (!r.ok())
    {
        Log("[ICON] Unable to load icon for menu item " + std::to_string(id) + ": " + r.message);
        return r;
    }

    NativeHandle bitmap = NULL_HANDLE;
    r = m_surface->IconToMenuBitmap(icon, bitmap);
    if (!r.ok())
    {
        Log("[ICON] Failed to convert icon to bitmap: " + r.message);
        return r;
    }

    if (!m_sync.SetItemBitmap(id, bitmap))
        return TrayResult::Fail(TrayError::UnknownItem, "no menu item with ID " + std::to_string(id));
    return SyncItem(rec);
}

TrayResult TraySession::SyncItem(const MenuItemRecord& rec)
{
    if (!IsReady()) return TrayResult::Fail(TrayError::NotReady, "tray not ready");

    TrayResult r = m_sync.Upsert(rec);
    // NotReady waits for registration; UnknownItem lost a race with removal
    if (!r.ok() && r.error != TrayError::NotReady && r.error != TrayError::UnknownItem)
        Log("[MENU] Unable to add or update menu item " + std::to_string(rec.id) + ": " + r.message);
    return r;
}

void TraySession::SyncPendingItems()
{
    // Ids ascend with creation order, so parents go before their children
    for (MenuItemId id : m_registry.Ids())
    {
        MenuItemRecord rec;
        if (!m_registry.Find(id, rec)) continue;
        SyncItem(rec);
    }
}
