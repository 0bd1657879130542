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

#include "menu_item.h"
#include "tray_session.h"

static TrayResult NoSession()
{
    return TrayResult::Fail(TrayError::UnknownItem, "menu item has no session");
}

MenuItemId MenuItem::ParentId() const
{
    MenuItemRecord rec;
    if (!m_session || !m_session->Registry().Find(m_id, rec)) return ROOT_MENU_ID;
    return rec.parent;
}

std::string MenuItem::Title() const
{
    MenuItemRecord rec;
    if (!m_session || !m_session->Registry().Find(m_id, rec)) return {};
    return rec.title;
}

bool MenuItem::Disabled() const
{
    MenuItemRecord rec;
    if (!m_session || !m_session->Registry().Find(m_id, rec)) return false;
    return rec.disabled;
}

bool MenuItem::Checked() const
{
    MenuItemRecord rec;
    if (!m_session || !m_session->Registry().Find(m_id, rec)) return false;
    return rec.checked;
}

void MenuItem::SetCallback(std::function<void()> onClick)
{
    if (m_session) m_session->SetItemCallback(m_id, std::move(onClick));
}

MenuItem MenuItem::AddSubMenuItem(const std::string& title)
{
    if (!m_session) return {};
    return m_session->AddChild(m_id, title);
}

TrayResult MenuItem::AddSeparator()
{
    if (!m_session) return NoSession();
    return m_session->AddSeparatorTo(m_id);
}

TrayResult MenuItem::SetTitle(const std::string& title)
{
    if (!m_session) return NoSession();
    return m_session->SetItemTitle(m_id, title);
}

TrayResult MenuItem::Enable()
{
    if (!m_session) return NoSession();
    return m_session->SetItemDisabled(m_id, false);
}

TrayResult MenuItem::Disable()
{
    if (!m_session) return NoSession();
    return m_session->SetItemDisabled(m_id, true);
}

TrayResult MenuItem::Check()
{
    if (!m_session) return NoSession();
    return m_session->SetItemChecked(m_id, true);
}

TrayResult MenuItem::Uncheck()
{
    if (!m_session) return NoSession();
    return m_session->SetItemChecked(m_id, false);
}

TrayResult MenuItem::Hide()
{
    if (!m_session) return NoSession();
    return m_session->HideItem(m_id);
}

TrayResult MenuItem::Show()
{
    if (!m_session) return NoSession();
    return m_session->ShowItem(m_id);
}

TrayResult MenuItem::Remove()
{
    if (!m_session) return NoSession();
    return m_session->RemoveItem(m_id);
}

TrayResult MenuItem::SetIcon(const std::vector<uint8_t>& iconBytes)
{
    if (!m_session) return NoSession();
    return m_session->SetItemIconFromBytes(m_id, iconBytes);
}

TrayResult MenuItem::SetIconFromFilePath(const std::string& iconFilePath)
{
    if (!m_session) return NoSession();
    return m_session->SetItemIconFromFile(m_id, iconFilePath);
}

std::string MenuItem::ToString() const
{
    MenuItemRecord rec;
    if (!m_session || !m_session->Registry().Find(m_id, rec))
        return "MenuItem[" + std::to_string(m_id) + ", removed]";

    if (rec.parent == ROOT_MENU_ID)
        return "MenuItem[" + std::to_string(rec.id) + ", \"" + rec.title + "\"]";

    return "MenuItem[" + std::to_string(rec.id) + ", parent " + std::to_string(rec.parent) +
           ", \"" + rec.title + "\"]";
}
