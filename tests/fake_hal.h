// =============================================================================
// fake_hal.h - Recording pin and delay doubles for host tests
// =============================================================================

#pragma once

#include "hal.h"
#include <cstddef>
#include <cstdint>
#include <vector>

class FakeInput : public DigitalInput {
public:
    FakeInput() : level(false), reads(0) {}

    bool read() override {
        reads++;
        return level;
    }

    bool level;
    int reads;
};

class FakePwm : public PwmOutput {
public:
    void set_duty(uint8_t duty) override {
        writes.push_back(duty);
    }

    std::vector<uint8_t> writes;
};

class FakeDelay : public Delay {
public:
    FakeDelay() : on_sleep(nullptr), on_sleep_data(nullptr) {}

    void sleep_ms(uint32_t ms) override {
        sleeps.push_back(ms);
        if (on_sleep) on_sleep(sleeps.size(), on_sleep_data);
    }

    std::vector<uint32_t> sleeps;

    // Called after each sleep with the running sleep count
    void (*on_sleep)(size_t, void*);
    void* on_sleep_data;
};
