// =============================================================================
// motor_pwm.h - Motor PWM Drive
// Purpose: 8-bit PWM on the transistor base pin using the RP2040 PWM slices
// =============================================================================

#pragma once

#include "hal.h"
#include "pico/types.h"
#include <cstdint>

// =============================================================================
// MotorPwm Class
// =============================================================================
class MotorPwm : public PwmOutput {
public:
    /**
     * @brief Constructor
     * @param pin GPIO number driving the transistor base
     * @param freq_hz PWM carrier frequency
     */
    MotorPwm(uint pin, uint32_t freq_hz);

    /**
     * @brief Configure the PWM slice and start it at duty 0
     * @return false for a bad pin or a frequency the divider cannot reach
     */
    bool init();

    /**
     * @brief Set motor duty
     * @param duty 0 = off, 255 = full on
     */
    void set_duty(uint8_t duty) override;

    uint8_t get_duty() const;

    /**
     * @brief Get the clock divider chosen by init()
     */
    float get_clkdiv() const;

private:
    uint gpio_pin;
    uint32_t frequency_hz;
    uint slice;
    uint channel;
    float clkdiv;
    uint8_t duty;
    bool initialized;
};
