#pragma once

#include <cstdint>
#include <string>

enum Operation
{
    INSN_CLS,
    INSN_RET,
    INSN_JP,
    INSN_CALL,
    INSN_SE_IMM,
    INSN_SNE_IMM,
    INSN_SE_REG,
    INSN_LD_IMM,
    INSN_ADD_IMM,
    INSN_LD_REG,
    INSN_OR,
    INSN_AND,
    INSN_XOR,
    INSN_ADD_REG,
    INSN_SUB,
    INSN_SHR,
    INSN_SUBN,
    INSN_SHL,
    INSN_SNE_REG,
    INSN_LD_I,
    INSN_JP_V0,
    INSN_RND,
    INSN_DRW,
    INSN_SKP,
    INSN_SKNP,
    INSN_LD_VX_DT,
    INSN_LD_VX_K,
    INSN_LD_DT_VX,
    INSN_LD_ST_VX,
    INSN_ADD_I_VX,
    INSN_LD_F_VX,
    INSN_LD_B_VX,
    INSN_LD_I_VX,
    INSN_LD_VX_I,
    INSN_UNKNOWN,
};

struct Instruction
{
    Operation operation;
    uint16_t word;
    uint8_t x;      // bits 11-8
    uint8_t y;      // bits 7-4
    uint8_t n;      // bits 3-0
    uint8_t kk;     // bits 7-0
    uint16_t nnn;   // bits 11-0
};

Instruction decode(uint16_t instructionWord);

std::string disassemble(uint16_t pc, uint16_t instructionWord);
