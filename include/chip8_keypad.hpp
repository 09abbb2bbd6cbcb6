#pragma once

#include <cstdint>

struct Chip8Keypad {
    static const unsigned s_keyCount = 16;

    uint8_t m_keyStates[s_keyCount]; // hex keypad buttonstates
    uint8_t m_pressEdges[s_keyCount]; // released -> pressed since last ArmWait

    void Reset ();

    // Host side.
    void SetKey (uint8_t key, bool pressed);
    void KeyDown (uint8_t key) { SetKey(key, true); }
    void KeyUp (uint8_t key)   { SetKey(key, false); }

    // Machine side.
    bool IsPressed (uint8_t key) const { return m_keyStates[key & 0x0F] != 0; }
    void ArmWait ();
    bool PollPress (uint8_t * key);
};
