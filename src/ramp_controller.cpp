// =============================================================================
// ramp_controller.cpp - Motor Ramp Controller Implementation
// =============================================================================

#include "ramp_controller.h"
#include <algorithm>
#include <cstdio>

const char* ramp_state_name(RampState state) {
    switch (state) {
        case RampState::IDLE:         return "IDLE";
        case RampState::RAMPING_UP:   return "RAMPING_UP";
        case RampState::RAMPING_DOWN: return "RAMPING_DOWN";
    }
    return "UNKNOWN";
}

bool RampProfile::is_valid() const {
    return min_duty < max_duty && step >= 1;
}

uint32_t RampProfile::writes_per_sweep() const {
    if (!is_valid()) return 0;

    // Steps from min to max, last one clamped, plus the starting value
    uint32_t range = (uint32_t)(max_duty - min_duty);
    uint32_t one_way = (range + step - 1) / step + 1;
    return one_way * 2;
}

MotorRampController::MotorRampController(DigitalInput* in, PwmOutput* out,
                                         Delay* dly, const RampProfile& p)
    : input(in)
    , output(out)
    , delay(dly)
    , profile(p)
    , state(RampState::IDLE)
    , duty(p.min_duty)
    , ramps_completed(0)
    , initialized(false)
    , state_callback(nullptr)
    , state_callback_data(nullptr) {
}

bool MotorRampController::init() {
    initialized = false;
    if (!input || !output || !delay) return false;
    if (!profile.is_valid()) return false;

    // Motor off before anything else
    duty = profile.min_duty;
    output->set_duty(duty);

    ramps_completed = 0;
    state = RampState::IDLE;
    initialized = true;
    return true;
}

bool MotorRampController::poll_and_ramp() {
    if (!initialized) return false;

    // Sampled once per cycle; the sweep always runs to completion
    if (!input->read()) return false;

    set_state(RampState::RAMPING_UP);
    int value = profile.min_duty;
    while (true) {
        write_step((uint8_t)value);
        if (value >= profile.max_duty) break;
        value = std::min(value + (int)profile.step, (int)profile.max_duty);
    }

    set_state(RampState::RAMPING_DOWN);
    while (true) {
        write_step((uint8_t)value);
        if (value <= profile.min_duty) break;
        value = std::max(value - (int)profile.step, (int)profile.min_duty);
    }

    ramps_completed++;
#if DEBUG_ENABLE_SERIAL
    printf("Ramp complete (%lu total)\n", (unsigned long)ramps_completed);
#endif
    set_state(RampState::IDLE);
    return true;
}

void MotorRampController::tick() {
    if (!poll_and_ramp()) {
        delay->sleep_ms(POLL_INTERVAL_MS);
    }
}

RampState MotorRampController::get_state() const {
    return state;
}

uint8_t MotorRampController::get_duty() const {
    return duty;
}

uint32_t MotorRampController::get_ramps_completed() const {
    return ramps_completed;
}

const RampProfile& MotorRampController::get_profile() const {
    return profile;
}

void MotorRampController::register_callback(void (*callback)(RampState, void*),
                                            void* user_data) {
    state_callback = callback;
    state_callback_data = user_data;
}

void MotorRampController::set_state(RampState new_state) {
    if (new_state == state) return;
    state = new_state;

    if (state_callback) {
        state_callback(state, state_callback_data);
    }
}

void MotorRampController::write_step(uint8_t value) {
    duty = value;
    output->set_duty(duty);
    delay->sleep_ms(profile.step_delay_ms);
}
