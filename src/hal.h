// =============================================================================
// hal.h - Hardware Abstraction Interfaces
// Purpose: Pin and timing interfaces used by the ramp controller
// =============================================================================

#pragma once

#include <cstdint>

// =============================================================================
// DigitalInput - a single boolean sense line
// =============================================================================
class DigitalInput {
public:
    virtual ~DigitalInput() {}

    /**
     * @brief Sample the line
     * @return true while the line is asserted
     */
    virtual bool read() = 0;
};

// =============================================================================
// PwmOutput - a single PWM drive line with 8-bit duty
// =============================================================================
class PwmOutput {
public:
    virtual ~PwmOutput() {}

    /**
     * @brief Set output duty
     * @param duty 0 = fully off, 255 = fully on
     */
    virtual void set_duty(uint8_t duty) = 0;
};

// =============================================================================
// Delay - blocking suspend of the calling thread
// =============================================================================
class Delay {
public:
    virtual ~Delay() {}

    virtual void sleep_ms(uint32_t ms) = 0;
};
