#pragma once

#include <cstdint>

struct Chip8Stack {
    static const unsigned s_stackSize = 16;

    uint16_t m_stack[s_stackSize];
    uint8_t  m_sp; // stack pointer, also the current depth

    void Reset ();

    // Both return false, leaving the stack untouched, on overflow/underflow.
    bool Push (uint16_t returnAddr);
    bool Pop (uint16_t * returnAddr);

    unsigned Depth () const { return m_sp; }
};
