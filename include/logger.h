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

#ifndef TRAYKIT_LOGGER_H
#define TRAYKIT_LOGGER_H

#include <string>
#include <filesystem>

// Log a message to the global log file
void Log(const std::string& msg);

// Get the path to the log directory
std::filesystem::path GetLogPath();

// Redirect logging to another directory (empty path restores the default)
void SetLogDirectory(const std::filesystem::path& dir);

#endif // TRAYKIT_LOGGER_H
