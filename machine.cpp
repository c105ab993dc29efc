#include <algorithm>

#include "machine.h"

const std::array<uint8_t, 80> digitSprites = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

const char *stepStatusName(StepStatus status)
{
    switch(status) {
        case CONTINUE: return "continue";
        case UNSUPPORTED_INSTRUCTION: return "unsupported instruction";
        case ADDRESS_OUT_OF_RANGE: return "address out of range";
        case STACK_OVERFLOW: return "stack overflow";
        case STACK_UNDERFLOW: return "stack underflow";
        case KEY_OUT_OF_RANGE: return "key out of range";
        case RANDOM_SOURCE_FAILED: return "random source failed";
    }
    return "unknown status";
}

void MachineState::reset()
{
    memory.fill(0);
    registers.fill(0);
    stack.fill(0);
    I = 0;
    pc = PROGRAM_START;
    sp = 0;
    DT = 0;
    ST = 0;
    std::copy(digitSprites.begin(), digitSprites.end(), memory.begin());
}

bool MachineState::load(const std::vector<uint8_t>& program)
{
    if(program.size() > MAX_PROGRAM_SIZE) {
        return false;
    }
    std::copy(program.begin(), program.end(), memory.begin() + PROGRAM_START);
    return true;
}
