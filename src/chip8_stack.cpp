#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/chip8_stack.hpp"

//=====================================================================
const unsigned Chip8Stack::s_stackSize;

//=====================================================================
void Chip8Stack::Reset () {
    CSaruCore::SecureZero(m_stack, sizeof(m_stack));
    m_sp = 0;
}

//=====================================================================
bool Chip8Stack::Push (uint16_t returnAddr) {
    if (m_sp >= s_stackSize)
        return false;
    m_stack[m_sp++] = returnAddr;
    return true;
}

//=====================================================================
bool Chip8Stack::Pop (uint16_t * returnAddr) {
    if (!m_sp)
        return false;
    *returnAddr = m_stack[--m_sp];
    return true;
}
