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

#ifndef TRAYKIT_CONSTANTS_H
#define TRAYKIT_CONSTANTS_H

#include <cstddef>
#include <cstdint>

// Logging
static constexpr char LOG_DIR_NAME[] = "TrayKit";
static constexpr char LOG_FILENAME[] = "traykit.log";

// Config
static constexpr char CONFIG_FILENAME[] = "traykit.json";

// Native window / notification area
static constexpr wchar_t TRAY_WINDOW_CLASS[] = L"TrayKitClass";
static constexpr wchar_t TASKBAR_CREATED_MSG[] = L"TaskbarCreated";
static constexpr uint32_t TRAY_ICON_UID = 100;       // NOTIFYICONDATA uID
static constexpr uint32_t TRAY_CALLBACK_OFFSET = 1;  // WM_USER + offset

// NOTIFYICONDATAW::szTip holds 128 wide chars including the terminator
static constexpr size_t TRAY_TOOLTIP_MAX = 127;

// Icon cache key prefixes
static constexpr char ICON_KEY_FILE[] = "file:";
static constexpr char ICON_KEY_BYTES[] = "bytes:";

#endif // TRAYKIT_CONSTANTS_H
