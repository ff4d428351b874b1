// =============================================================================
// main.cpp - Motor Ramp Application Main
// Purpose: Bring up the hardware and run the button-triggered motor ramp
// =============================================================================

#include "pico/stdlib.h"
#include <cstdio>

#include "config.h"
#include "button_input.h"
#include "motor_pwm.h"
#include "pico_delay.h"
#include "status_led.h"
#include "ramp_controller.h"

// =============================================================================
// Global Objects
// =============================================================================
ButtonInput start_button(BUTTON_PIN, BUTTON_PULL_DOWN != 0);
MotorPwm motor_pwm(MOTOR_PWM_PIN, PWM_FREQ_HZ);
PicoDelay pico_delay;
StatusLed status_led(STATUS_LED_PIN);
MotorRampController ramp_controller(&start_button, &motor_pwm, &pico_delay);

// =============================================================================
// Function Prototypes
// =============================================================================
bool init_hardware();
void print_banner();
void on_ramp_state(RampState state, void* user_data);
void halt(const char* reason);

// =============================================================================
// Main Application
// =============================================================================
int main() {
    stdio_init_all();

    // Short delay for hardware stabilization
    sleep_ms(STARTUP_DELAY_MS);

    if (!init_hardware()) {
        halt("hardware init failed");
    }

    if (!ramp_controller.init()) {
        halt("invalid ramp profile");
    }
    ramp_controller.register_callback(on_ramp_state, &status_led);

    print_banner();

    // Main loop - runs until power is removed
    while (true) {
        ramp_controller.tick();
    }

    return 0;
}

// =============================================================================
// Hardware Initialization
// =============================================================================
bool init_hardware() {
    // Motor output first so it is held off while the rest comes up
    if (!motor_pwm.init()) {
        printf("ERROR: PWM init failed on GPIO%d (%d Hz)\n",
               MOTOR_PWM_PIN, PWM_FREQ_HZ);
        return false;
    }

    if (!start_button.init()) {
        printf("ERROR: button init failed on GPIO%d\n", BUTTON_PIN);
        return false;
    }

    if (!status_led.init()) {
        printf("ERROR: LED init failed on GPIO%d\n", STATUS_LED_PIN);
        return false;
    }

    return true;
}

void print_banner() {
#if DEBUG_ENABLE_SERIAL
    const RampProfile& p = ramp_controller.get_profile();
    printf("=== Motor Ramp v1.0 ===\n");
    printf("Button GPIO%d, motor PWM GPIO%d @ %d Hz (clkdiv %.2f)\n",
           BUTTON_PIN, MOTOR_PWM_PIN, PWM_FREQ_HZ, motor_pwm.get_clkdiv());
    printf("Ramp %u..%u step %u, %lu ms/step, %lu writes/sweep\n",
           (unsigned)p.min_duty, (unsigned)p.max_duty, (unsigned)p.step,
           (unsigned long)p.step_delay_ms, (unsigned long)p.writes_per_sweep());
    printf("Waiting for button...\n");
#endif
}

// =============================================================================
// Ramp State Observer
// =============================================================================
void on_ramp_state(RampState state, void* user_data) {
    StatusLed* led = static_cast<StatusLed*>(user_data);
    led->set(state != RampState::IDLE);

#if DEBUG_ENABLE_SERIAL
    printf("[RAMP] %s duty=%u\n", ramp_state_name(state),
           (unsigned)ramp_controller.get_duty());
#endif
}

// =============================================================================
// Fatal Error
// =============================================================================
void halt(const char* reason) {
    motor_pwm.set_duty(0);
    printf("ERROR: %s - system halted\n", reason);
    while (true) tight_loop_contents();
}
