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

#include "utils.h"
#ifdef _WIN32
#include <windows.h>
#endif

const char* TrayErrorName(TrayError error)
{
    switch (error)
    {
    case TrayError::None:             return "ok";
    case TrayError::NotReady:         return "tray not ready yet";
    case TrayError::NativeCallFailed: return "native call failed";
    case TrayError::UnknownItem:      return "unknown menu item";
    case TrayError::PumpFailed:       return "message loop failure";
    case TrayError::InvalidArgument:  return "invalid argument";
    case TrayError::ConfigInvalid:    return "invalid configuration";
    }
    return "unknown error";
}

std::string HashBytesHex(const std::vector<uint8_t>& bytes)
{
    uint64_t h = 14695981039346656037ULL;
    for (uint8_t b : bytes)
    {
        h ^= b;
        h *= 1099511628211ULL;
    }

    static const char digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i)
    {
        out[i] = digits[h & 0xF];
        h >>= 4;
    }
    return out;
}

size_t Utf16Length(const std::string& s)
{
    size_t count = 0;
    for (unsigned char c : s)
    {
        // Continuation bytes (10xxxxxx) belong to the previous code point
        if ((c & 0xC0) == 0x80) continue;
        // Four-byte sequences lie outside the BMP and need a surrogate pair
        count += (c >= 0xF0) ? 2 : 1;
    }
    return count;
}

#ifdef _WIN32
std::string WideToUtf8(const wchar_t* wstr)
{
    if (!wstr || !*wstr) return "";
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr, -1, nullptr, 0, nullptr, nullptr);
    if (len <= 0) return "";

    std::string result;
    result.resize(len - 1);
    WideCharToMultiByte(CP_UTF8, 0, wstr, -1, &result[0], len, nullptr, nullptr);
    return result;
}

std::wstring Utf8ToWide(const std::string& str)
{
    if (str.empty()) return L"";
    int len = MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, nullptr, 0);
    if (len <= 0) return L"";

    std::wstring result;
    result.resize(len - 1);
    MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, &result[0], len);
    return result;
}
#endif
