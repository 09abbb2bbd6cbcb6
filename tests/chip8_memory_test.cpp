#include <vector>

#include <gtest/gtest.h>

#include "../include/chip8_memory.hpp"

namespace {

class Chip8MemoryTest : public ::testing::Test {
protected:
    void SetUp () override {
        m_memory.Clear();
        m_memory.LoadFont();
    }

    Chip8Memory m_memory;
};

} // namespace

TEST_F(Chip8MemoryTest, FontMatchesConventionalGlyphs) {
    // "0" and "F"
    const uint8_t zero[] = { 0xF0, 0x90, 0x90, 0x90, 0xF0 };
    const uint8_t eff[]  = { 0xF0, 0x80, 0xF0, 0x80, 0x80 };
    for (unsigned i = 0; i < 5; ++i) {
        EXPECT_EQ(zero[i], m_memory.Read(Chip8Memory::GlyphAddress(0x0) + i));
        EXPECT_EQ(eff[i], m_memory.Read(Chip8Memory::GlyphAddress(0xF) + i));
    }
    EXPECT_EQ(0, m_memory.Read(Chip8Memory::s_fontEnd));
}

TEST_F(Chip8MemoryTest, GlyphAddressUsesLowNibble) {
    EXPECT_EQ(Chip8Memory::s_fontBegin + 7 * 5, Chip8Memory::GlyphAddress(0x07));
    EXPECT_EQ(Chip8Memory::GlyphAddress(0x0A), Chip8Memory::GlyphAddress(0xFA));
}

TEST_F(Chip8MemoryTest, ProgramIsCopiedVerbatimAt0x200) {
    const uint8_t program[] = { 0x12, 0x34, 0xAB, 0xCD, 0xEF };
    ASSERT_TRUE(m_memory.LoadProgram(program, sizeof(program)));
    for (unsigned i = 0; i < sizeof(program); ++i)
        EXPECT_EQ(program[i], m_memory.Read(Chip8Memory::s_progRomRamBegin + i));
    EXPECT_EQ(0, m_memory.Read(Chip8Memory::s_progRomRamBegin + sizeof(program)));
}

TEST_F(Chip8MemoryTest, ProgramFillingAllSpaceLoads) {
    std::vector<uint8_t> program(Chip8Memory::s_progCapacity, 0x5A);
    ASSERT_TRUE(m_memory.LoadProgram(program.data(), program.size()));
    EXPECT_EQ(0x5A, m_memory.Read(Chip8Memory::s_progRomRamEnd));
}

TEST_F(Chip8MemoryTest, OversizedProgramIsRejectedUntouched) {
    std::vector<uint8_t> program(Chip8Memory::s_progCapacity + 1, 0x5A);
    EXPECT_FALSE(m_memory.LoadProgram(program.data(), program.size()));
    EXPECT_EQ(0, m_memory.Read(Chip8Memory::s_progRomRamBegin));
    EXPECT_EQ(0, m_memory.Read(Chip8Memory::s_progRomRamEnd));
}

TEST_F(Chip8MemoryTest, WordsAreBigEndian) {
    m_memory.Write(0x300, 0xD0);
    m_memory.Write(0x301, 0x05);
    EXPECT_EQ(0xD005, m_memory.ReadWord(0x300));
}

TEST_F(Chip8MemoryTest, AddressesWrapTo12Bits) {
    m_memory.Write(0x1FFF, 0x42);
    EXPECT_EQ(0x42, m_memory.Read(0x0FFF));

    m_memory.Write(0x0FFF, 0xAA);
    EXPECT_EQ(0xAA00 | m_memory.Read(0x000), m_memory.ReadWord(0x0FFF));
}
