#pragma once

#include <cstddef>
#include <cstdint>

struct Chip8Memory {
    static const unsigned s_memoryBytes = 4096;
    static const uint16_t s_addressMask = 0x0FFF;

    static const uint16_t s_interpreterBegin = 0x000;
    static const uint16_t s_interpreterEnd   = 0x1FF;
    static const uint16_t s_fontBegin        = 0x000;
    static const uint16_t s_fontEnd          = 0x050;
    static const uint16_t s_fontGlyphBytes   =     5;
    static const uint16_t s_progRomRamBegin  = 0x200;
    static const uint16_t s_progRomRamEnd    = 0xFFF;
    static const unsigned s_progCapacity     = s_progRomRamEnd - s_progRomRamBegin + 1;

    uint8_t m_bytes[s_memoryBytes];

    void Clear ();
    void LoadFont ();
    bool LoadProgram (const uint8_t * program, std::size_t size);

    // Addresses wrap to 12 bits.
    uint8_t  Read (uint16_t addr) const    { return m_bytes[addr & s_addressMask]; }
    void     Write (uint16_t addr, uint8_t value) { m_bytes[addr & s_addressMask] = value; }
    uint16_t ReadWord (uint16_t addr) const; // big-endian

    static uint16_t GlyphAddress (uint8_t digit);
};
