#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/chip8_display.hpp"

//=====================================================================
const unsigned Chip8Display::s_renderWidth;
const unsigned Chip8Display::s_renderHeight;
const unsigned Chip8Display::s_spriteWidth;

//=====================================================================
void Chip8Display::Clear () {
    CSaruCore::SecureZero(m_renderOut, sizeof(m_renderOut));
}

//=====================================================================
bool Chip8Display::DrawSprite (uint8_t x, uint8_t y, const uint8_t * rows, unsigned height) {

    const unsigned left = x % s_renderWidth;
    const unsigned top  = y % s_renderHeight;
    bool collision = false;

    for (unsigned row = 0; row < height; ++row) {
        const unsigned py = top + row;
        if (py >= s_renderHeight)
            break; // clip, don't wrap

        const uint8_t bits = rows[row];
        for (unsigned col = 0; col < s_spriteWidth; ++col) {
            const unsigned px = left + col;
            if (px >= s_renderWidth)
                break;
            if (!(bits & (0x80 >> col)))
                continue;

            auto & pixel = m_renderOut[py * s_renderWidth + px];
            if (pixel)
                collision = true;
            pixel ^= 1;
        }
    }

    return collision;

}
