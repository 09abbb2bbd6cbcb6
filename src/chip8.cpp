// This is *heavily*  based on Laurence Muller's tutorial at
// http://www.multigesture.net/articles/how-to-write-an-emulator-chip-8-interpreter/

#include <cstdio>

#include "../include/chip8.hpp"

//=====================================================================
//
// Static locals
//
//=====================================================================

//=====================================================================
static inline unsigned OpX (uint16_t opcode)   { return (opcode & 0x0F00) >> 8; }
static inline unsigned OpY (uint16_t opcode)   { return (opcode & 0x00F0) >> 4; }
static inline unsigned OpN (uint16_t opcode)   { return opcode & 0x000F; }
static inline uint8_t  OpNN (uint16_t opcode)  { return uint8_t(opcode & 0x00FF); }
static inline uint16_t OpNNN (uint16_t opcode) { return opcode & 0x0FFF; }


//=====================================================================
//
// Free functions
//
//=====================================================================

//=====================================================================
const char * Chip8FaultName (Chip8Fault fault) {
    switch (fault) {
        case Chip8Fault::None:              return "none";
        case Chip8Fault::BadOpcode:         return "bad opcode";
        case Chip8Fault::StackOverflow:     return "stack overflow";
        case Chip8Fault::StackUnderflow:    return "stack underflow";
        case Chip8Fault::ProgramTooLarge:   return "program too large";
        case Chip8Fault::ProgramUnreadable: return "program unreadable";
    }
    return "unknown";
}


//=====================================================================
//
// Chip8 definitions
//
//=====================================================================

//=====================================================================
void Chip8::Initialize (unsigned randSeed) {

    m_memory.Clear();
    m_memory.LoadFont();
    m_reg.Reset(Chip8Memory::s_progRomRamBegin);
    m_stack.Reset();
    m_display.Clear();
    m_keypad.Reset();

    m_opcode           = 0x0000;
    m_awaitingKey      = false;
    m_awaitKeyRegister = 0;
    m_fault            = Chip8Fault::None;
    m_faultOpcode      = 0x0000;
    m_faultPc          = 0x0000;
    m_drawFlag         = false;

    m_rng.seed(randSeed);

}

//=====================================================================
bool Chip8::LoadProgram (const uint8_t * program, std::size_t size) {

    if (!m_memory.LoadProgram(program, size)) {
        Fault(Chip8Fault::ProgramTooLarge, Chip8Memory::s_progRomRamBegin);
        return false;
    }

    m_reg.m_pc = Chip8Memory::s_progRomRamBegin;
    return true;

}

//=====================================================================
bool Chip8::LoadProgramFile (const char * path) {

    std::FILE * progFile = std::fopen(path, "rb");
    if (!progFile) {
        std::fprintf(stderr, "Chip8: Failed to open program file at {%s}.\n", path);
        Fault(Chip8Fault::ProgramUnreadable, Chip8Memory::s_progRomRamBegin);
        return false;
    }

    // One byte of slack so oversized programs are caught instead of truncated.
    uint8_t buffer[Chip8Memory::s_progCapacity + 1];
    std::size_t readCount = std::fread(
        buffer,
        1, /* size of element to read (in bytes) */
        sizeof(buffer), /* number of element to read */
        progFile
    );
    const bool readError = std::ferror(progFile) != 0;
    std::fclose(progFile);
    if (!readCount || readError) {
        std::fprintf(stderr, "Chip8: Failed to read from program file {%s}.\n", path);
        Fault(Chip8Fault::ProgramUnreadable, Chip8Memory::s_progRomRamBegin);
        return false;
    }

    return LoadProgram(buffer, readCount);

}

//=====================================================================
void Chip8::Fault (Chip8Fault fault, uint16_t pc) {

    if (IsHalted())
        return;

    m_fault       = fault;
    m_faultOpcode = m_opcode;
    m_faultPc     = pc;

    std::fprintf(
        stderr,
        "Chip8: Halted on %s, opcode {0x%04X} at {0x%04X} ({0x%04X}).\n",
        Chip8FaultName(fault),
        m_opcode,
        pc,
        uint16_t(pc - Chip8Memory::s_progRomRamBegin)
    );

}

//=====================================================================
bool Chip8::EmulateCycle () {

    if (IsHalted())
        return false;

    // FX0A holds the PC until a key goes down.
    if (m_awaitingKey) {
        uint8_t key;
        if (m_keypad.PollPress(&key)) {
            m_reg.m_v[m_awaitKeyRegister] = key;
            m_awaitingKey = false;
        }
        return true;
    }

    // Fetch opcode
    const uint16_t pc = m_reg.m_pc;
    m_opcode   = m_memory.ReadWord(pc);
    m_reg.m_pc = uint16_t((pc + 2) & Chip8Memory::s_addressMask);

    auto & v  = m_reg.m_v;
    auto & vx = v[OpX(m_opcode)];
    auto & vy = v[OpY(m_opcode)];

    // Decode opcode
    switch (m_opcode & 0xF000) {
        case 0x0000:
            Execute0(pc);
        break;

        case 0x1000: // 0x1NNN: jump to NNN
            m_reg.m_pc = OpNNN(m_opcode);
        break;

        case 0x2000: // 0x2NNN: call NNN
            if (!m_stack.Push(m_reg.m_pc)) {
                Fault(Chip8Fault::StackOverflow, pc);
                break;
            }
            m_reg.m_pc = OpNNN(m_opcode);
        break;

        case 0x3000: // 0x3XNN: skip next instruction if VX == NN
            if (vx == OpNN(m_opcode))
                SkipNext();
        break;

        case 0x4000: // 0x4XNN: skip next instruction if VX != NN
            if (vx != OpNN(m_opcode))
                SkipNext();
        break;

        case 0x5000: // 0x5XY0: skip next instruction if VX == VY
            if (OpN(m_opcode)) {
                Fault(Chip8Fault::BadOpcode, pc);
                break;
            }
            if (vx == vy)
                SkipNext();
        break;

        case 0x6000: // 0x6XNN: set VX to NN
            vx = OpNN(m_opcode);
        break;

        case 0x7000: // 0x7XNN: add NN to VX, VF untouched
            vx = uint8_t(vx + OpNN(m_opcode));
        break;

        case 0x8000:
            Execute8(pc);
        break;

        case 0x9000: // 0x9XY0: skip next instruction if VX != VY
            if (OpN(m_opcode)) {
                Fault(Chip8Fault::BadOpcode, pc);
                break;
            }
            if (vx != vy)
                SkipNext();
        break;

        case 0xA000: // 0xANNN: set I to NNN
            m_reg.m_i = OpNNN(m_opcode);
        break;

        case 0xB000: // 0xBNNN: jump to NNN + V0
            m_reg.m_pc = uint16_t((OpNNN(m_opcode) + v[0]) & Chip8Memory::s_addressMask);
        break;

        case 0xC000: // 0xCXNN: VX = (rand & NN)
            vx = uint8_t(m_rng() & OpNN(m_opcode));
        break;

        case 0xD000:
            DrawSprite();
        break;

        case 0xE000:
            ExecuteE(pc);
        break;

        case 0xF000:
            ExecuteF(pc);
        break;
    }

    return !IsHalted();

}

//=====================================================================
void Chip8::SkipNext () {
    m_reg.m_pc = uint16_t((m_reg.m_pc + 2) & Chip8Memory::s_addressMask);
}

//=====================================================================
void Chip8::Execute0 (uint16_t pc) {

    if (m_opcode == 0x00E0) { // 0x00E0: clear the screen
        m_display.Clear();
        m_drawFlag = true;
    }
    else if (m_opcode == 0x00EE) { // 0x00EE: return from call
        uint16_t returnAddr;
        if (!m_stack.Pop(&returnAddr)) {
            Fault(Chip8Fault::StackUnderflow, pc);
            return;
        }
        m_reg.m_pc = returnAddr;
    }
    else { // 0x0NNN machine-code calls aren't supported
        Fault(Chip8Fault::BadOpcode, pc);
    }

}

//=====================================================================
void Chip8::Execute8 (uint16_t pc) {

    // VF is written after VX so the flag wins when X is F.
    auto & v  = m_reg.m_v;
    auto & vx = v[OpX(m_opcode)];
    auto & vy = v[OpY(m_opcode)];
    auto & vf = v[Chip8Registers::s_flag];

    switch (OpN(m_opcode)) {
        case 0x0: // 0x8XY0: set VX to VY
            vx = vy;
        break;

        case 0x1: // 0x8XY1: VX |= VY
            vx |= vy;
        break;

        case 0x2: // 0x8XY2: VX &= VY
            vx &= vy;
        break;

        case 0x3: // 0x8XY3: VX ^= VY
            vx ^= vy;
        break;

        case 0x4: { // 0x8XY4: VX += VY, VF = carry
            const unsigned sum = unsigned(vx) + unsigned(vy);
            vx = uint8_t(sum);
            vf = sum > 0xFF ? 1 : 0;
        } break;

        case 0x5: { // 0x8XY5: VX -= VY, VF = 0 on borrow; 1 otherwise
            const uint8_t flag = (vy > vx) ? 0 : 1;
            vx = uint8_t(vx - vy);
            vf = flag;
        } break;

        case 0x6: { // 0x8XY6: VX = VY >> 1, VF = bit shifted out
            const uint8_t flag = vy & 0x01;
            vx = uint8_t(vy >> 1);
            vf = flag;
        } break;

        case 0x7: { // 0x8XY7: VX = VY - VX, VF = 0 on borrow; 1 otherwise
            const uint8_t flag = (vx > vy) ? 0 : 1;
            vx = uint8_t(vy - vx);
            vf = flag;
        } break;

        case 0xE: { // 0x8XYE: VX = VY << 1, VF = bit shifted out
            const uint8_t flag = (vy & 0x80) ? 1 : 0;
            vx = uint8_t(vy << 1);
            vf = flag;
        } break;

        default:
            Fault(Chip8Fault::BadOpcode, pc);
        break;
    }

}

//=====================================================================
void Chip8::ExecuteE (uint16_t pc) {

    const uint8_t key = m_reg.m_v[OpX(m_opcode)];

    if ((m_opcode & 0xF0FF) == 0xE09E) { // 0xEX9E
        // skip next instruction if key at VX is pressed
        if (m_keypad.IsPressed(key))
            SkipNext();
    }
    else if ((m_opcode & 0xF0FF) == 0xE0A1) { // 0xEXA1
        // skip next instruction if key at VX isn't pressed
        if (!m_keypad.IsPressed(key))
            SkipNext();
    }
    else {
        Fault(Chip8Fault::BadOpcode, pc);
    }

}

//=====================================================================
void Chip8::ExecuteF (uint16_t pc) {

    const unsigned x  = OpX(m_opcode);
    auto &         v  = m_reg.m_v;
    auto &         vx = v[x];

    switch (OpNN(m_opcode)) {
        case 0x07: // 0xFX07: VX = delay timer
            vx = m_reg.m_delayTimer;
        break;

        case 0x0A: // 0xFX0A: wait for a key press, store it in VX
            m_awaitingKey      = true;
            m_awaitKeyRegister = uint8_t(x);
            m_keypad.ArmWait();
        break;

        case 0x15: // 0xFX15: delay timer = VX
            m_reg.m_delayTimer = vx;
        break;

        case 0x18: // 0xFX18: sound timer = VX
            m_reg.m_soundTimer = vx;
        break;

        case 0x1E: // 0xFX1E: I += VX, VF untouched
            m_reg.m_i = uint16_t(m_reg.m_i + vx);
        break;

        case 0x29: // 0xFX29: I = address of font glyph for digit in VX
            m_reg.m_i = Chip8Memory::GlyphAddress(vx);
        break;

        case 0x33: // 0xFX33: BCD of VX at I, I+1, I+2
            m_memory.Write(m_reg.m_i,     uint8_t(vx / 100));
            m_memory.Write(m_reg.m_i + 1, uint8_t(vx / 10 % 10));
            m_memory.Write(m_reg.m_i + 2, uint8_t(vx % 10));
        break;

        case 0x55: // 0xFX55: store V0..VX at I; I unchanged
            for (unsigned r = 0; r <= x; ++r)
                m_memory.Write(uint16_t(m_reg.m_i + r), v[r]);
        break;

        case 0x65: // 0xFX65: load V0..VX from I; I unchanged
            for (unsigned r = 0; r <= x; ++r)
                v[r] = m_memory.Read(uint16_t(m_reg.m_i + r));
        break;

        default:
            Fault(Chip8Fault::BadOpcode, pc);
        break;
    }

}

//=====================================================================
void Chip8::DrawSprite () {

    // 0xDXYN: XOR-draw N rows of 8-bit-wide sprites from I
    // at (VX, VY), (VX, VY+1), etc.
    // VF set to 1 if a pixel is toggled off, otherwise 0.
    const unsigned height = OpN(m_opcode);
    uint8_t rows[15];
    for (unsigned row = 0; row < height; ++row)
        rows[row] = m_memory.Read(uint16_t(m_reg.m_i + row));

    const bool collision = m_display.DrawSprite(
        m_reg.m_v[OpX(m_opcode)],
        m_reg.m_v[OpY(m_opcode)],
        rows,
        height
    );
    m_reg.m_v[Chip8Registers::s_flag] = collision ? 1 : 0;
    m_drawFlag = true;

}
