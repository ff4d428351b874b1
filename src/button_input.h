// =============================================================================
// button_input.h - Pushbutton Sense Line
// Purpose: GPIO input for the motor start button
// =============================================================================

#pragma once

#include "hal.h"
#include "pico/types.h"
#include <cstdint>

// =============================================================================
// ButtonInput Class
// =============================================================================
class ButtonInput : public DigitalInput {
public:
    /**
     * @brief Constructor
     * @param pin GPIO number
     * @param pull_down Enable the internal pull-down
     */
    ButtonInput(uint pin, bool pull_down = true);

    /**
     * @brief Initialize GPIO as input
     * @return false if the pin does not exist
     */
    bool init();

    /**
     * @brief Read the button
     * @return true while the switch is closed
     */
    bool read() override;

    uint get_pin() const;

private:
    uint gpio_pin;
    bool use_pull_down;
};
