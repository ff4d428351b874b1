// =============================================================================
// pico_delay.h - Blocking Delay on the Pico SDK timer
// =============================================================================

#pragma once

#include "hal.h"
#include "pico/stdlib.h"

class PicoDelay : public Delay {
public:
    void sleep_ms(uint32_t ms) override {
        ::sleep_ms(ms);
    }
};
