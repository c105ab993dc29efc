#pragma once

#include <array>
#include <cstdint>
#include <vector>

constexpr uint16_t MEMORY_SIZE = 4096;
constexpr int REGISTER_COUNT = 16;
constexpr int STACK_DEPTH = 16;
constexpr uint16_t PROGRAM_START = 0x200;
constexpr uint16_t MAX_PROGRAM_SIZE = MEMORY_SIZE - PROGRAM_START;
constexpr uint16_t DIGIT_SPRITE_SIZE = 5;

// Written into a stack slot when RET pops it.
constexpr uint16_t RETURN_SENTINEL = 0xBEEF;

extern const std::array<uint8_t, 80> digitSprites;

enum StepStatus
{
    CONTINUE,
    UNSUPPORTED_INSTRUCTION,
    ADDRESS_OUT_OF_RANGE,
    STACK_OVERFLOW,
    STACK_UNDERFLOW,
    KEY_OUT_OF_RANGE,
    RANDOM_SOURCE_FAILED,
};

const char *stepStatusName(StepStatus status);

struct StepResult
{
    StepStatus status;
    uint16_t pc;                // address of the instruction that produced this result
    uint16_t instructionWord;
};

struct MachineState
{
    std::array<uint8_t, MEMORY_SIZE> memory = {0};
    std::array<uint8_t, REGISTER_COUNT> registers = {0};
    std::array<uint16_t, STACK_DEPTH> stack = {0};
    uint16_t I = 0;
    uint16_t pc = 0;
    uint8_t sp = 0;
    uint8_t DT = 0;
    uint8_t ST = 0;

    void reset();

    // Copies the image to PROGRAM_START.  Returns false, leaving memory
    // untouched, if the image does not fit.
    bool load(const std::vector<uint8_t>& program);
};
