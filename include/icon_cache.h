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

#ifndef TRAYKIT_ICON_CACHE_H
#define TRAYKIT_ICON_CACHE_H

#include "types.h"
#include "native_surface.h"
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Read-through cache of loaded icons, keyed by "file:<path>" or
// "bytes:<content hash>". Entries live as long as the cache.
// Two threads missing on the same key may both load; the last store wins.
class IconCache {
public:
    explicit IconCache(NativeMenuSurface& surface) : m_surface(surface) {}

    IconCache(const IconCache&) = delete;
    IconCache& operator=(const IconCache&) = delete;

    TrayResult LoadFromFile(const std::string& path, NativeHandle& out);
    TrayResult LoadFromBytes(const std::vector<uint8_t>& bytes, NativeHandle& out);

    // Generic read-through entry point used by the two loaders above.
    TrayResult Load(const std::string& key, const std::function<TrayResult(NativeHandle&)>& loader, NativeHandle& out);

    bool Lookup(const std::string& key, NativeHandle& out) const;
    size_t Size() const;

    static std::string FileKey(const std::string& path);
    static std::string BytesKey(const std::vector<uint8_t>& bytes);

private:
    NativeMenuSurface& m_surface;
    mutable std::shared_mutex m_mtx;
    std::unordered_map<std::string, NativeHandle> m_icons;
};

#endif // TRAYKIT_ICON_CACHE_H
