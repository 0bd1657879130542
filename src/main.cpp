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

#ifdef _WIN32

#include "tray_session.h"
#include "win32_surface.h"
#include "config.h"
#include "logger.h"
#include "utils.h"
#include <windows.h>
#include <atomic>
#include <string>

// Small tray application showing the library end to end.
int wmain(int argc, wchar_t** argv)
{
    std::filesystem::path configPath = DefaultConfigPath();

    for (int i = 1; i < argc; i++)
    {
        std::wstring arg = argv[i];
        if (arg == L"--help" || arg == L"-h" || arg == L"/?")
        {
            MessageBoxW(nullptr,
                L"TrayKit demo\n\n"
                L"Usage: traykit_demo.exe [OPTIONS]\n\n"
                L"Options:\n"
                L"  --help, -h, /?      Show this help message\n"
                L"  --config <file>     Load settings from a JSON file\n",
                L"TrayKit - Help", MB_OK | MB_ICONINFORMATION);
            return 0;
        }
        else if (arg == L"--config" && i + 1 < argc)
        {
            configPath = argv[++i];
        }
    }

    TrayConfig cfg;
    TrayResult loaded = LoadTrayConfig(configPath, cfg);
    if (!loaded.ok())
    {
        // Keep going with defaults; the reason is already in the log
        cfg = TrayConfig{};
    }

    Log("=== TrayKit demo started ===");

    TraySession session(CreateWin32Surface());
    if (cfg.tooltip.empty()) cfg.tooltip = "TrayKit demo";
    TrayResult applied = session.ApplyConfig(cfg);
    if (!applied.ok()) Log("[CONFIG] Settings not applied: " + applied.message);

    std::atomic<int> clicks{0};

    TrayResult r = session.Run(
        [&] {
            // Menu failures are logged by the session itself
            MenuItem hello = session.AddMenuItem("Say hello");
            hello.SetCallback([&] {
                int n = clicks.fetch_add(1) + 1;
                Log("[TRAY] Hello clicked " + std::to_string(n) + " time(s)");
            });

            MenuItem options = session.AddMenuItem("Options");
            MenuItem autoStart = options.AddSubMenuItem("Start with Windows");
            autoStart.SetCallback([autoStart]() mutable {
                if (autoStart.Checked()) autoStart.Uncheck();
                else autoStart.Check();
            });
            options.AddSeparator();
            MenuItem reset = options.AddSubMenuItem("Rebuild menu");
            reset.Disable();

            session.AddSeparator();
            MenuItem quit = session.AddMenuItem("Quit");
            quit.SetCallback([&] { session.Quit(); });
        },
        [] { Log("[TRAY] Exit callback reached."); });

    if (!r.ok())
    {
        MessageBoxW(nullptr, Utf8ToWide(r.message).c_str(), L"TrayKit", MB_OK | MB_ICONERROR);
        return 1;
    }

    Log("=== TrayKit demo stopped ===");
    return 0;
}

#endif // _WIN32
