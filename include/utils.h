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

#ifndef TRAYKIT_UTILS_H
#define TRAYKIT_UTILS_H

#include "types.h"
#include <cstdint>
#include <string>
#include <vector>

// 64-bit FNV-1a digest of a byte buffer as 16 lowercase hex digits
std::string HashBytesHex(const std::vector<uint8_t>& bytes);

// Number of UTF-16 code units needed for a UTF-8 string
size_t Utf16Length(const std::string& s);

#ifdef _WIN32
// Convert wide string to UTF-8
std::string WideToUtf8(const wchar_t* wstr);

// Convert UTF-8 to wide string
std::wstring Utf8ToWide(const std::string& str);
#endif

#endif // TRAYKIT_UTILS_H
