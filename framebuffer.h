#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// 64x32 monochrome display.  Sprites drawn with draw() wrap at the edges.
struct Framebuffer
{
    static constexpr int WIDTH = 64;
    static constexpr int HEIGHT = 32;

    std::array<std::array<uint8_t, WIDTH>, HEIGHT> display;
    bool displayChanged = true;

    Framebuffer()
    {
        clear();
    }

    void clear();

    // XORs rows of 8 pixels, MSB leftmost, onto the display at (x, y).
    // Returns true if any pixel that was on got turned off.
    bool draw(uint32_t x, uint32_t y, const uint8_t *sprite, size_t rows);

    void setPixel(uint32_t x, uint32_t y, bool on);
    bool getPixel(uint32_t x, uint32_t y) const;
};
