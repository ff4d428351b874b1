// =============================================================================
// status_led.h - Diagnostic LED
// Purpose: Show ramp activity on the on-board LED
// =============================================================================

#pragma once

#include "pico/types.h"

class StatusLed {
public:
    explicit StatusLed(uint pin);

    /**
     * @brief Configure GPIO as output, LED off
     * @return false if the pin does not exist
     */
    bool init();

    void set(bool on);
    bool is_on() const;

private:
    uint gpio_pin;
    bool state;
};
