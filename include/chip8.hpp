// This is *heavily*  based on Laurence Muller's tutorial at
// http://www.multigesture.net/articles/how-to-write-an-emulator-chip-8-interpreter/

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

#include "chip8_display.hpp"
#include "chip8_keypad.hpp"
#include "chip8_memory.hpp"
#include "chip8_registers.hpp"
#include "chip8_stack.hpp"

enum class Chip8Fault : uint8_t {
    None,
    BadOpcode,
    StackOverflow,
    StackUnderflow,
    ProgramTooLarge,
    ProgramUnreadable,
};

const char * Chip8FaultName (Chip8Fault fault);

struct Chip8 {
    Chip8Memory    m_memory;
    Chip8Registers m_reg;
    Chip8Stack     m_stack;
    Chip8Display   m_display;
    Chip8Keypad    m_keypad;

    uint16_t m_opcode;

    bool     m_awaitingKey; // FX0A in progress; PC holds until a key goes down
    uint8_t  m_awaitKeyRegister;

    Chip8Fault m_fault;
    uint16_t   m_faultOpcode;
    uint16_t   m_faultPc; // address the faulting instruction was fetched from

    bool     m_drawFlag; // whether or not a GUI application should render

    std::minstd_rand m_rng;

    void Initialize (unsigned randSeed);
    bool LoadProgram (const uint8_t * program, std::size_t size);
    bool LoadProgramFile (const char * path);

    // Fetch, decode and execute one instruction. Returns false once halted.
    bool EmulateCycle ();
    void TickTimers () { m_reg.TickTimers(); }

    bool IsHalted () const    { return m_fault != Chip8Fault::None; }
    bool SoundActive () const { return m_reg.m_soundTimer != 0; }

private:
    void Fault (Chip8Fault fault, uint16_t pc);
    void SkipNext ();

    void Execute0 (uint16_t pc);
    void Execute8 (uint16_t pc);
    void ExecuteE (uint16_t pc);
    void ExecuteF (uint16_t pc);
    void DrawSprite ();
};
