#pragma once

#include <array>
#include <cstdint>
#include <vector>

constexpr int KEY_COUNT = 16;

struct Keypad
{
    std::array<bool, KEY_COUNT> keyPressed;

    Keypad()
    {
        keyPressed.fill(false);
    }

    // Replaces the whole pressed set; keys not listed are released.
    void setPressed(const std::vector<uint8_t>& keys);

    // Throws std::out_of_range for a key outside 0..15.
    bool isDown(uint8_t key) const;
};
