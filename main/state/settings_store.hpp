#ifndef SETTINGS_STORE_HPP
#define SETTINGS_STORE_HPP

#include <cstdint>

// NVS persistence for the few values that survive a reboot. Control
// thresholds are compile-time and never stored here.
namespace SettingsStore {
    // Returns the stored legacy raw threshold, or fallback if none is stored
    // (fallback is written back so the next boot finds it).
    uint16_t loadLegacyThreshold(uint16_t fallback);

    bool saveLegacyThreshold(uint16_t raw);
}

#endif // SETTINGS_STORE_HPP
