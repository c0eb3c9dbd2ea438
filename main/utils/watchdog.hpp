#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <esp_task_wdt.h>

namespace Watchdog {
    // Reconfigure the TWDT from Config::Watchdog (call once from app_main before tasks start)
    void init();
    // Subscribe calling task to TWDT; returns false if the TWDT rejected it
    bool subscribe();
    // Reset the timer for the calling task - call once per task loop
    void feed();
}

#endif // WATCHDOG_HPP
