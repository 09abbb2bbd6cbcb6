#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/chip8_keypad.hpp"

//=====================================================================
const unsigned Chip8Keypad::s_keyCount;

//=====================================================================
void Chip8Keypad::Reset () {
    CSaruCore::SecureZero(m_keyStates, sizeof(m_keyStates));
    CSaruCore::SecureZero(m_pressEdges, sizeof(m_pressEdges));
}

//=====================================================================
void Chip8Keypad::SetKey (uint8_t key, bool pressed) {
    auto & state = m_keyStates[key & 0x0F];
    if (pressed && !state)
        m_pressEdges[key & 0x0F] = 1;
    state = pressed ? 1 : 0;
}

//=====================================================================
void Chip8Keypad::ArmWait () {
    CSaruCore::SecureZero(m_pressEdges, sizeof(m_pressEdges));
}

//=====================================================================
bool Chip8Keypad::PollPress (uint8_t * key) {
    for (unsigned k = 0; k < s_keyCount; ++k) {
        if (!m_pressEdges[k])
            continue;
        m_pressEdges[k] = 0;
        *key = uint8_t(k);
        return true;
    }
    return false;
}
