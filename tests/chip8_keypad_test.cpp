#include <gtest/gtest.h>

#include "../include/chip8_keypad.hpp"

namespace {

class Chip8KeypadTest : public ::testing::Test {
protected:
    void SetUp () override { m_keypad.Reset(); }

    Chip8Keypad m_keypad;
};

} // namespace

TEST_F(Chip8KeypadTest, SetAndClear) {
    EXPECT_FALSE(m_keypad.IsPressed(0xA));
    m_keypad.KeyDown(0xA);
    EXPECT_TRUE(m_keypad.IsPressed(0xA));
    EXPECT_FALSE(m_keypad.IsPressed(0xB));
    m_keypad.KeyUp(0xA);
    EXPECT_FALSE(m_keypad.IsPressed(0xA));
}

TEST_F(Chip8KeypadTest, PollReportsOnlyNewPresses) {
    m_keypad.KeyDown(0x3);
    m_keypad.ArmWait();

    uint8_t key = 0xFF;
    EXPECT_FALSE(m_keypad.PollPress(&key)); // held before the wait began
    EXPECT_EQ(0xFF, key);

    m_keypad.SetKey(0x3, true); // still held, no transition
    EXPECT_FALSE(m_keypad.PollPress(&key));

    m_keypad.KeyDown(0x9);
    ASSERT_TRUE(m_keypad.PollPress(&key));
    EXPECT_EQ(0x9, key);
    EXPECT_FALSE(m_keypad.PollPress(&key));
}

TEST_F(Chip8KeypadTest, ReleaseAndPressAgainCounts) {
    m_keypad.KeyDown(0x5);
    m_keypad.ArmWait();
    m_keypad.KeyUp(0x5);
    m_keypad.KeyDown(0x5);

    uint8_t key = 0;
    ASSERT_TRUE(m_keypad.PollPress(&key));
    EXPECT_EQ(0x5, key);
}

TEST_F(Chip8KeypadTest, KeysAreMaskedToSixteen) {
    m_keypad.KeyDown(0x1C);
    EXPECT_TRUE(m_keypad.IsPressed(0xC));
}
