// =============================================================================
// motor_pwm.cpp - Motor PWM Drive Implementation
// =============================================================================

#include "motor_pwm.h"
#include "config.h"
#include "hardware/clocks.h"
#include "hardware/gpio.h"
#include "hardware/pwm.h"

MotorPwm::MotorPwm(uint pin, uint32_t freq_hz)
    : gpio_pin(pin)
    , frequency_hz(freq_hz)
    , slice(0)
    , channel(0)
    , clkdiv(1.0f)
    , duty(0)
    , initialized(false) {
}

bool MotorPwm::init() {
    if (gpio_pin >= NUM_GPIO_PINS) return false;
    if (frequency_hz == 0) return false;

    // f_pwm = f_sys / (clkdiv * (wrap + 1))
    uint32_t sys_hz = clock_get_hz(clk_sys);
    clkdiv = (float)sys_hz / ((float)frequency_hz * (float)(PWM_WRAP + 1));

    // Divider is 8.4 fixed point
    if (clkdiv < 1.0f || clkdiv >= 256.0f) return false;

    gpio_set_function(gpio_pin, GPIO_FUNC_PWM);
    slice = pwm_gpio_to_slice_num(gpio_pin);
    channel = pwm_gpio_to_channel(gpio_pin);

    pwm_config cfg = pwm_get_default_config();
    pwm_config_set_clkdiv(&cfg, clkdiv);
    pwm_config_set_wrap(&cfg, PWM_WRAP);
    pwm_init(slice, &cfg, false);

    duty = 0;
    pwm_set_chan_level(slice, channel, 0);
    pwm_set_enabled(slice, true);

    initialized = true;
    return true;
}

void MotorPwm::set_duty(uint8_t d) {
    duty = d;
    if (!initialized) return;
    pwm_set_chan_level(slice, channel, d);
}

uint8_t MotorPwm::get_duty() const {
    return duty;
}

float MotorPwm::get_clkdiv() const {
    return clkdiv;
}
