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

#include "logger.h"
#include "constants.h"
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <mutex>
#include <chrono>

static std::mutex g_logMtx;
static std::filesystem::path g_logDirOverride;

static std::filesystem::path DefaultLogPath()
{
#ifdef _WIN32
    wchar_t* programData = nullptr;
    size_t len = 0;
    if (_wdupenv_s(&programData, &len, L"ProgramData") == 0 && programData)
    {
        std::filesystem::path result = std::filesystem::path(programData) / LOG_DIR_NAME;
        free(programData);
        return result;
    }
    return std::filesystem::path(L"C:\\ProgramData") / LOG_DIR_NAME;
#else
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return tmp / "traykit";
#endif
}

std::filesystem::path GetLogPath()
{
    std::lock_guard lg(g_logMtx);
    return g_logDirOverride.empty() ? DefaultLogPath() : g_logDirOverride;
}

void SetLogDirectory(const std::filesystem::path& dir)
{
    std::lock_guard lg(g_logMtx);
    g_logDirOverride = dir;
}

void Log(const std::string& msg)
{
    std::lock_guard lg(g_logMtx);
    try
    {
        std::filesystem::path dir = g_logDirOverride.empty() ? DefaultLogPath() : g_logDirOverride;

        std::error_code ec;
        if (!std::filesystem::exists(dir, ec))
        {
            std::filesystem::create_directories(dir, ec);
        }

        std::ofstream log(dir / LOG_FILENAME, std::ios::app);
        if (log)
        {
            auto now = std::chrono::system_clock::now();
            std::time_t t = std::chrono::system_clock::to_time_t(now);

            const size_t TIMEBUF_SIZE = 32;
            char timebuf[TIMEBUF_SIZE] = {0};
            struct tm timeinfo;

#ifdef _WIN32
            bool haveTime = (localtime_s(&timeinfo, &t) == 0);
#else
            bool haveTime = (localtime_r(&t, &timeinfo) != nullptr);
#endif
            if (haveTime)
            {
                if (std::strftime(timebuf, TIMEBUF_SIZE, "%Y-%m-%d %H:%M:%S", &timeinfo) > 0)
                {
                    log << timebuf << "  " << msg << std::endl;
                }
                else
                {
                    log << "[Timestamp Error] " << msg << std::endl;
                }
            }
            else
            {
                // Fallback if time conversion fails
                log << msg << std::endl;
            }
        }
    }
    catch (const std::exception&)
    {
        // Logging must never take the tray down
    }
}
