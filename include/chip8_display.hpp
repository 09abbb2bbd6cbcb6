#pragma once

#include <cstdint>

struct Chip8Display {
    static const unsigned s_renderWidth  = 64;
    static const unsigned s_renderHeight = 32;
    static const unsigned s_spriteWidth  =  8;

    uint8_t m_renderOut[s_renderWidth * s_renderHeight]; // 64x32 B&W display, row-major

    void Clear ();

    // XOR-draws `height` rows of 8-pixel sprite data with its top-left corner
    // at (x % width, y % height). Pixels past the right or bottom edge are
    // clipped. Returns true if any set pixel was turned off.
    bool DrawSprite (uint8_t x, uint8_t y, const uint8_t * rows, unsigned height);

    bool Pixel (unsigned x, unsigned y) const {
        return m_renderOut[y * s_renderWidth + x] != 0;
    }

    // Read-only view for the rendering collaborator.
    const uint8_t * Snapshot () const { return m_renderOut; }
};
