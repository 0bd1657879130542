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

#ifndef TRAYKIT_CONFIG_H
#define TRAYKIT_CONFIG_H

#include "types.h"
#include <filesystem>
#include <string>
#include "nlohmann/json.hpp" // Required for serialization

struct TrayConfig {
    std::string tooltip;
    std::string iconPath;
    bool openOnLeftClick = true;
    bool openOnRightClick = true;
    std::string logDirectory;
};

class ConfigValidator {
public:
    static bool Validate(const nlohmann::json& j, std::string* reason = nullptr);
};

// <log dir>/traykit.json
std::filesystem::path DefaultConfigPath();

// Missing file -> defaults and Ok. Malformed or invalid -> ConfigInvalid.
TrayResult LoadTrayConfig(const std::filesystem::path& path, TrayConfig& out);
TrayResult ParseTrayConfig(const nlohmann::json& j, TrayConfig& out);
TrayResult SaveTrayConfig(const std::filesystem::path& path, const TrayConfig& cfg);

nlohmann::json TrayConfigToJson(const TrayConfig& cfg);

#endif // TRAYKIT_CONFIG_H
