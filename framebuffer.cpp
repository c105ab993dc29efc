#include <cstdio>

#include "debug.h"
#include "framebuffer.h"

void Framebuffer::clear()
{
    for(auto& rowOfPixels : display) {
        for(auto& pixel : rowOfPixels) {
            pixel = 0;
        }
    }
    displayChanged = true;
}

bool Framebuffer::draw(uint32_t x, uint32_t y, const uint8_t *sprite, size_t rows)
{
    bool erased = false;

    for(size_t rowIndex = 0; rowIndex < rows; rowIndex++) {
        uint8_t byte = sprite[rowIndex];
        for(uint32_t bitIndex = 0; bitIndex < 8; bitIndex++) {
            bool hasPixel = (byte >> (7 - bitIndex)) & 0x1;
            if(hasPixel) {
                uint32_t col = (x + bitIndex) % WIDTH;
                uint32_t row = (y + rowIndex) % HEIGHT;
                if(debug & DEBUG_DRAW) {
                    printf("draw %u %u (%u)\n", col, row, col + row * WIDTH);
                }
                bool oldValue = getPixel(col, row);
                if(oldValue) {
                    erased = true;
                }
                setPixel(col, row, !oldValue);
            }
        }
    }

    return erased;
}

void Framebuffer::setPixel(uint32_t x, uint32_t y, bool on)
{
    display.at(y).at(x) = on ? 1 : 0;
    displayChanged = true;
}

bool Framebuffer::getPixel(uint32_t x, uint32_t y) const
{
    return display.at(y).at(x) != 0;
}
