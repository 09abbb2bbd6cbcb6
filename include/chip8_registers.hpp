#pragma once

#include <cstdint>

struct Chip8Registers {
    static const unsigned s_registerCount = 16;
    static const unsigned s_flag          = 0xF;

    uint8_t  m_v[s_registerCount]; // registers V0-VF
    uint16_t m_i;  // index register
    uint16_t m_pc; // program counter
    uint8_t  m_delayTimer; // decrement if not 0
    uint8_t  m_soundTimer; // decrement if not 0; tone while not 0

    void Reset (uint16_t pc);

    // Timer ticker: one 60 Hz tick of both countdown timers, clamped at 0.
    void TickTimers ();
};
