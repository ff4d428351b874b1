// =============================================================================
// button_input.cpp - Pushbutton Sense Line Implementation
// =============================================================================

#include "button_input.h"
#include "config.h"
#include "hardware/gpio.h"

ButtonInput::ButtonInput(uint pin, bool pull_down)
    : gpio_pin(pin)
    , use_pull_down(pull_down) {
}

bool ButtonInput::init() {
    if (gpio_pin >= NUM_GPIO_PINS) return false;

    gpio_init(gpio_pin);
    gpio_set_dir(gpio_pin, GPIO_IN);

    // Switch pulls the line high; board resistor holds it low
    if (use_pull_down) {
        gpio_pull_down(gpio_pin);
    } else {
        gpio_disable_pulls(gpio_pin);
    }

    return true;
}

bool ButtonInput::read() {
    return gpio_get(gpio_pin);
}

uint ButtonInput::get_pin() const {
    return gpio_pin;
}
