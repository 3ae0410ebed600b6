#pragma once
// ReloadSettings.h
//
// Tunables for a Reloadable, loadable from a JSON file:
//
//   { "watch":   { "debounceMs": 1000, "pollIntervalMs": 250 },
//     "loader":  { "shadowCopy": true, "shadowDirectory": "" },
//     "logging": { "level": "info", "file": "" } }
//
// Every key is optional. Out-of-range numbers are clamped, unknown log levels are ignored.

#include "LiveReload/Logging.hpp"
#include "LiveReload/ReloadModule.h"

#include <string>

namespace LiveReload {

    struct WatchSettings {
        unsigned int debounceMs = 1000;
        unsigned int pollIntervalMs = 250;
    };

    struct ReloadSettings {
        WatchSettings watch;
        LoaderSettings loader;
        ReloadLogging::LogSettings logging;
    };

    // Range limits applied while loading.
    constexpr unsigned int kMaxDebounceMs = 60000;
    constexpr unsigned int kMinPollIntervalMs = 10;
    constexpr unsigned int kMaxPollIntervalMs = 10000;

    // Returns false if the file is missing or malformed; 'out' then keeps the values it had.
    bool LoadReloadSettings(const std::string& filePath, ReloadSettings& out);

    // Writes every field. Creates the parent directory if needed.
    bool SaveReloadSettings(const std::string& filePath, const ReloadSettings& settings);

} // namespace LiveReload
