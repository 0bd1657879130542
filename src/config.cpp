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

#include "config.h"
#include "constants.h"
#include "logger.h"
#include "utils.h"
#include <fstream>

using json = nlohmann::json;

std::filesystem::path DefaultConfigPath()
{
    return GetLogPath() / CONFIG_FILENAME;
}

bool ConfigValidator::Validate(const json& j, std::string* reason)
{
    auto fail = [&](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (!j.is_object()) return fail("document is not an object");

    for (const char* key : { "tooltip", "icon", "log_directory" })
    {
        if (j.contains(key) && !j[key].is_string())
            return fail(std::string("'") + key + "' must be a string");
    }
    for (const char* key : { "open_on_left_click", "open_on_right_click" })
    {
        if (j.contains(key) && !j[key].is_boolean())
            return fail(std::string("'") + key + "' must be a boolean");
    }

    if (j.contains("tooltip") && Utf16Length(j["tooltip"].get<std::string>()) > TRAY_TOOLTIP_MAX)
        return fail("'tooltip' exceeds " + std::to_string(TRAY_TOOLTIP_MAX) + " characters");

    return true;
}

TrayResult ParseTrayConfig(const json& j, TrayConfig& out)
{
    std::string reason;
    if (!ConfigValidator::Validate(j, &reason))
        return TrayResult::Fail(TrayError::ConfigInvalid, reason);

    TrayConfig cfg;
    cfg.tooltip          = j.value("tooltip", cfg.tooltip);
    cfg.iconPath         = j.value("icon", cfg.iconPath);
    cfg.openOnLeftClick  = j.value("open_on_left_click", cfg.openOnLeftClick);
    cfg.openOnRightClick = j.value("open_on_right_click", cfg.openOnRightClick);
    cfg.logDirectory     = j.value("log_directory", cfg.logDirectory);

    out = cfg;
    return TrayResult::Ok();
}

TrayResult LoadTrayConfig(const std::filesystem::path& path, TrayConfig& out)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        out = TrayConfig{};
        return TrayResult::Ok();
    }

    std::ifstream f(path);
    if (!f)
    {
        Log("[CONFIG] Failed to open " + path.string());
        return TrayResult::Fail(TrayError::ConfigInvalid, "cannot open " + path.string());
    }

    try
    {
        json j = json::parse(f);
        TrayResult r = ParseTrayConfig(j, out);
        if (!r.ok())
            Log("[CONFIG] Rejected " + path.string() + ": " + r.message);
        return r;
    }
    catch (const json::exception& e)
    {
        Log(std::string("[CONFIG] Malformed JSON in ") + path.string() + ": " + e.what());
        return TrayResult::Fail(TrayError::ConfigInvalid, e.what());
    }
}

json TrayConfigToJson(const TrayConfig& cfg)
{
    json j;
    j["tooltip"] = cfg.tooltip;
    j["icon"] = cfg.iconPath;
    j["open_on_left_click"] = cfg.openOnLeftClick;
    j["open_on_right_click"] = cfg.openOnRightClick;
    j["log_directory"] = cfg.logDirectory;
    return j;
}

TrayResult SaveTrayConfig(const std::filesystem::path& path, const TrayConfig& cfg)
{
    try
    {
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path());

        std::ofstream f(path);
        if (!f)
        {
            Log("[CONFIG] Failed to write " + path.string());
            return TrayResult::Fail(TrayError::ConfigInvalid, "cannot write " + path.string());
        }
        f << TrayConfigToJson(cfg).dump(4) << std::endl;
        return TrayResult::Ok();
    }
    catch (const std::exception& e)
    {
        Log(std::string("[CONFIG] Exception saving config: ") + e.what());
        return TrayResult::Fail(TrayError::ConfigInvalid, e.what());
    }
}
