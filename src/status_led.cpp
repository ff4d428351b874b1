// =============================================================================
// status_led.cpp - Diagnostic LED Implementation
// =============================================================================

#include "status_led.h"
#include "config.h"
#include "hardware/gpio.h"

StatusLed::StatusLed(uint pin)
    : gpio_pin(pin)
    , state(false) {
}

bool StatusLed::init() {
    if (gpio_pin >= NUM_GPIO_PINS) return false;

    gpio_init(gpio_pin);
    gpio_set_dir(gpio_pin, GPIO_OUT);
    gpio_put(gpio_pin, 0);
    state = false;
    return true;
}

void StatusLed::set(bool on) {
    state = on;
    gpio_put(gpio_pin, on ? 1 : 0);
}

bool StatusLed::is_on() const {
    return state;
}
