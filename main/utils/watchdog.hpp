#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <esp_task_wdt.h>

// Task watchdog for the control loop. A stuck sensor read or control tick
// panics and reboots, which leaves the pump relay de-energised.
namespace Watchdog {
    // Configure TWDT (call once from app_main before tasks start)
    bool init();
    // Subscribe the calling task
    bool subscribe();
    // Reset the calling task's timer
    void feed();
}

#endif // WATCHDOG_HPP
