#pragma once

#include <cstdint>

struct Chip8;

struct Chip8ClockConfig {
    unsigned cyclesPerFrame;
    unsigned timerHz;

    Chip8ClockConfig () : cyclesPerFrame(10), timerHz(60) {}
};

// Fixed-timestep host loop: instructions are counted per frame, timers follow
// wall-clock time.
struct Chip8Clock {
    Chip8ClockConfig m_config;
    double           m_timerAccumulator; // seconds not yet spent on a tick
    uint64_t         m_cycles;
    uint64_t         m_ticks;

    explicit Chip8Clock (const Chip8ClockConfig & config = Chip8ClockConfig());

    void Reset ();

    // Runs one frame's worth of instructions, then one timer tick if a full
    // tick period has accumulated. Returns false if the machine is halted.
    bool RunFrame (Chip8 & chip8, double elapsedSeconds);
};
