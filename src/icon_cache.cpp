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

#include "icon_cache.h"
#include "constants.h"
#include "utils.h"
#include <mutex>

std::string IconCache::FileKey(const std::string& path)
{
    return std::string(ICON_KEY_FILE) + path;
}

std::string IconCache::BytesKey(const std::vector<uint8_t>& bytes)
{
    return std::string(ICON_KEY_BYTES) + HashBytesHex(bytes);
}

bool IconCache::Lookup(const std::string& key, NativeHandle& out) const
{
    std::shared_lock lock(m_mtx);
    auto it = m_icons.find(key);
    if (it == m_icons.end()) return false;
    out = it->second;
    return true;
}

size_t IconCache::Size() const
{
    std::shared_lock lock(m_mtx);
    return m_icons.size();
}

TrayResult IconCache::Load(const std::string& key, const std::function<TrayResult(NativeHandle&)>& loader, NativeHandle& out)
{
    if (Lookup(key, out)) return TrayResult::Ok();

    NativeHandle h = NULL_HANDLE;
    TrayResult r = loader(h);
    if (!r.ok()) return r;

    {
        std::unique_lock lock(m_mtx);
        m_icons[key] = h;
    }
    out = h;
    return TrayResult::Ok();
}

TrayResult IconCache::LoadFromFile(const std::string& path, NativeHandle& out)
{
    if (path.empty())
        return TrayResult::Fail(TrayError::InvalidArgument, "empty icon path");

    return Load(FileKey(path), [&](NativeHandle& h) {
        return m_surface.LoadIconFromFile(path, h);
    }, out);
}

TrayResult IconCache::LoadFromBytes(const std::vector<uint8_t>& bytes, NativeHandle& out)
{
    if (bytes.empty())
        return TrayResult::Fail(TrayError::InvalidArgument, "empty icon data");

    return Load(BytesKey(bytes), [&](NativeHandle& h) {
        return m_surface.LoadIconFromBytes(bytes, h);
    }, out);
}
