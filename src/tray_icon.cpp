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

#include "tray_icon.h"
#include "logger.h"

TrayResult TrayIcon::Add()
{
    std::lock_guard<std::mutex> lock(m_mtx);
    if (m_present) return TrayResult::Ok();

    TrayResult r = m_surface.AddTrayIcon();
    if (r.ok()) m_present = true;
    return r;
}

TrayResult TrayIcon::Remove()
{
    std::lock_guard<std::mutex> lock(m_mtx);
    if (!m_present) return TrayResult::Ok();

    // Kept as present on failure so a later Remove retries
    TrayResult r = m_surface.DeleteTrayIcon();
    if (r.ok()) m_present = false;
    return r;
}

void TrayIcon::OnTaskbarRestart()
{
    std::lock_guard<std::mutex> lock(m_mtx);
    if (!m_present) return;

    TrayResult r = m_surface.AddTrayIcon();
    if (!r.ok())
    {
        Log("[TRAY] Failed to restore icon after taskbar restart: " + r.message);
        return;
    }
    // The shell forgot everything, so replay the last icon and tip
    if (m_icon != NULL_HANDLE)
    {
        r = m_surface.SetTrayIcon(m_icon);
        if (!r.ok()) Log("[TRAY] Failed to restore icon image: " + r.message);
    }
    if (!m_tooltip.empty())
    {
        r = m_surface.SetTrayTooltip(m_tooltip);
        if (!r.ok()) Log("[TRAY] Failed to restore tooltip: " + r.message);
    }
    Log("[TRAY] Restored icon after taskbar restart.");
}

TrayResult TrayIcon::SetIcon(NativeHandle icon)
{
    std::lock_guard<std::mutex> lock(m_mtx);
    if (!m_present) return TrayResult::Fail(TrayError::NotReady, "tray icon not present");

    TrayResult r = m_surface.SetTrayIcon(icon);
    if (r.ok()) m_icon = icon;
    return r;
}

TrayResult TrayIcon::UpdateTooltip(const std::string& text)
{
    std::lock_guard<std::mutex> lock(m_mtx);
    if (!m_present) return TrayResult::Fail(TrayError::NotReady, "tray icon not present");

    TrayResult r = m_surface.SetTrayTooltip(text);
    if (r.ok()) m_tooltip = text;
    return r;
}

bool TrayIcon::IsPresent() const
{
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_present;
}

NativeHandle TrayIcon::Icon() const
{
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_icon;
}

std::string TrayIcon::Tooltip() const
{
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_tooltip;
}
