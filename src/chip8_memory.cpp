#include <cstdio>
#include <cstring>

#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/chip8_memory.hpp"

//=====================================================================
//
// Static locals
//
//=====================================================================

//=====================================================================
static const uint8_t s_fontSet[80] = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

static_assert(
    sizeof(s_fontSet) == Chip8Memory::s_fontEnd - Chip8Memory::s_fontBegin,
    "font table must fill its reserved range"
);


//=====================================================================
//
// Chip8Memory definitions
//
//=====================================================================

//=====================================================================
const unsigned Chip8Memory::s_memoryBytes;
const uint16_t Chip8Memory::s_addressMask;
const uint16_t Chip8Memory::s_interpreterBegin;
const uint16_t Chip8Memory::s_interpreterEnd;
const uint16_t Chip8Memory::s_fontBegin;
const uint16_t Chip8Memory::s_fontEnd;
const uint16_t Chip8Memory::s_fontGlyphBytes;
const uint16_t Chip8Memory::s_progRomRamBegin;
const uint16_t Chip8Memory::s_progRomRamEnd;
const unsigned Chip8Memory::s_progCapacity;

//=====================================================================
void Chip8Memory::Clear () {
    CSaruCore::SecureZero(m_bytes, sizeof(m_bytes));
}

//=====================================================================
void Chip8Memory::LoadFont () {
    std::memcpy(m_bytes + s_fontBegin, s_fontSet, sizeof(s_fontSet));
}

//=====================================================================
bool Chip8Memory::LoadProgram (const uint8_t * program, std::size_t size) {

    if (size > s_progCapacity) {
        std::fprintf(
            stderr,
            "Chip8Memory: Program of %zu bytes exceeds the %u bytes at {0x%04X}-{0x%04X}.\n",
            size,
            s_progCapacity,
            s_progRomRamBegin,
            s_progRomRamEnd
        );
        return false;
    }

    if (size)
        std::memcpy(m_bytes + s_progRomRamBegin, program, size);
    return true;

}

//=====================================================================
uint16_t Chip8Memory::ReadWord (uint16_t addr) const {
    return uint16_t(Read(addr) << 8 | Read(addr + 1));
}

//=====================================================================
uint16_t Chip8Memory::GlyphAddress (uint8_t digit) {
    return uint16_t(s_fontBegin + (digit & 0x0F) * s_fontGlyphBytes);
}
