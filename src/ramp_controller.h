// =============================================================================
// ramp_controller.h - Pushbutton Triggered Motor Ramp
// Purpose: Sample the button and sweep the motor PWM up to full and back off
// =============================================================================

#pragma once

#include "config.h"
#include "hal.h"
#include <cstdint>

// =============================================================================
// Ramp State
// =============================================================================
enum class RampState {
    IDLE,
    RAMPING_UP,
    RAMPING_DOWN
};

const char* ramp_state_name(RampState state);

// =============================================================================
// Ramp Profile
// =============================================================================
struct RampProfile {
    uint8_t min_duty;
    uint8_t max_duty;
    uint8_t step;
    uint32_t step_delay_ms;

    RampProfile()
        : min_duty(DUTY_MIN)
        , max_duty(DUTY_MAX)
        , step(RAMP_STEP)
        , step_delay_ms(RAMP_STEP_DELAY_MS) {
    }

    /**
     * @brief Check the profile describes a usable sweep
     * @return true if min < max and step >= 1
     */
    bool is_valid() const;

    /**
     * @brief Number of output writes for one full up/down sweep
     */
    uint32_t writes_per_sweep() const;
};

// =============================================================================
// MotorRampController Class
// =============================================================================
class MotorRampController {
public:
    /**
     * @brief Constructor
     * @param in Button sense line
     * @param out Motor PWM drive line
     * @param dly Blocking delay used between steps and polls
     * @param p Ramp shape
     */
    MotorRampController(DigitalInput* in, PwmOutput* out, Delay* dly,
                        const RampProfile& p = RampProfile());

    /**
     * @brief Validate the profile and force the motor off
     * @return false if the profile is unusable
     */
    bool init();

    /**
     * @brief Sample the button once and run a full sweep if it is pressed
     *
     * The sweep writes min..max then max..min, sleeping step_delay_ms
     * after every write. The button is not re-read until the sweep ends.
     *
     * @return true if a sweep ran
     */
    bool poll_and_ramp();

    /**
     * @brief One iteration of the driver loop
     * Sleeps POLL_INTERVAL_MS when the button was not pressed.
     */
    void tick();

    RampState get_state() const;
    uint8_t get_duty() const;
    uint32_t get_ramps_completed() const;
    const RampProfile& get_profile() const;

    /**
     * @brief Register a state change observer
     * @param callback Called with the new state on every transition
     * @param user_data Passed back to the callback
     */
    void register_callback(void (*callback)(RampState, void*), void* user_data);

private:
    DigitalInput* input;
    PwmOutput* output;
    Delay* delay;
    RampProfile profile;

    RampState state;
    uint8_t duty;
    uint32_t ramps_completed;
    bool initialized;

    void (*state_callback)(RampState, void*);
    void* state_callback_data;

    void set_state(RampState new_state);
    void write_step(uint8_t value);
};
