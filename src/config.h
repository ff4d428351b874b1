// =============================================================================
// config.h - Hardware Configuration and Constants
// Purpose: Central configuration for pins, PWM and ramp timing
// =============================================================================

#pragma once

#include <cstdint>

// =============================================================================
// PIN DEFINITIONS (Raspberry Pi Pico)
// =============================================================================

// Pushbutton sense line (switch to 3V3, pull-down on the board)
#define BUTTON_PIN          15
#define BUTTON_PULL_DOWN    1       // Also enable the internal pull-down

// Transistor base drive (through 1k resistor)
#define MOTOR_PWM_PIN       16

// On-board LED, lit while a ramp is running
#define STATUS_LED_PIN      25

// RP2040 has GPIO0..GPIO29
#define NUM_GPIO_PINS       30

// =============================================================================
// PWM SETTINGS
// =============================================================================
#define PWM_FREQ_HZ         20000   // Motor PWM carrier frequency (above audible)
#define PWM_WRAP            255     // 8-bit duty resolution

// =============================================================================
// RAMP PROFILE
// =============================================================================
#define DUTY_MIN            0       // Motor fully off
#define DUTY_MAX            255     // Motor fully on
#define RAMP_STEP           1       // Duty increment per step (see DESIGN.md)
#define RAMP_STEP_DELAY_MS  50      // Hold time after each step

// =============================================================================
// TIMING PARAMETERS
// =============================================================================
#define POLL_INTERVAL_MS    1       // Idle delay between button polls
#define STARTUP_DELAY_MS    100     // Hardware stabilization at boot

// =============================================================================
// DEBUG OPTIONS
// =============================================================================
#define DEBUG_ENABLE_SERIAL 1       // Enable serial debug output
