#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/chip8_registers.hpp"

//=====================================================================
const unsigned Chip8Registers::s_registerCount;
const unsigned Chip8Registers::s_flag;

//=====================================================================
void Chip8Registers::Reset (uint16_t pc) {
    CSaruCore::SecureZero(m_v, sizeof(m_v));
    m_i          = 0x0000;
    m_pc         = pc;
    m_delayTimer = 0;
    m_soundTimer = 0;
}

//=====================================================================
void Chip8Registers::TickTimers () {
    if (m_delayTimer)
        --m_delayTimer;
    if (m_soundTimer)
        --m_soundTimer;
}
