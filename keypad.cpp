#include "keypad.h"

void Keypad::setPressed(const std::vector<uint8_t>& keys)
{
    std::array<bool, KEY_COUNT> pressed;
    pressed.fill(false);
    for(uint8_t key : keys) {
        pressed.at(key) = true;
    }
    keyPressed = pressed;
}

bool Keypad::isDown(uint8_t key) const
{
    return keyPressed.at(key);
}
