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

#ifndef TRAYKIT_TYPES_H
#define TRAYKIT_TYPES_H

#include <cstdint>
#include <string>
#include <utility>

// Menu item identifier. 0 is reserved for the root menu ("no parent").
using MenuItemId = uint32_t;
static constexpr MenuItemId ROOT_MENU_ID = 0;

// Opaque native resource (HMENU, HICON, HBITMAP). 0 is the null handle.
using NativeHandle = std::uintptr_t;
static constexpr NativeHandle NULL_HANDLE = 0;

enum class TrayError {
    None = 0,
    NotReady,          // Session not initialized yet
    NativeCallFailed,  // Native surface rejected a command
    UnknownItem,       // Id has no registry record
    PumpFailed,        // Message loop failure (fatal for the session)
    InvalidArgument,
    ConfigInvalid
};

const char* TrayErrorName(TrayError error);

struct TrayResult {
    TrayError error = TrayError::None;
    std::string message;

    bool ok() const { return error == TrayError::None; }

    static TrayResult Ok() { return {}; }
    static TrayResult Fail(TrayError code, std::string msg = {}) {
        return { code, std::move(msg) };
    }
};

// Display attributes handed to the native surface for one menu entry.
struct NativeItemInfo {
    MenuItemId id = 0;
    std::string title;
    bool separator = false;
    bool disabled = false;
    bool checked = false;
    NativeHandle bitmap = NULL_HANDLE;  // Optional item icon
    NativeHandle submenu = NULL_HANDLE; // Optional nested menu
};

#endif // TRAYKIT_TYPES_H
