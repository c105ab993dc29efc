#include <cstdio>

#include "instruction.h"

namespace {

enum InstructionHighNybble
{
    HIGH_SYS = 0x0,
    HIGH_JP = 0x1,
    HIGH_CALL = 0x2,
    HIGH_SE_IMM = 0x3,
    HIGH_SNE_IMM = 0x4,
    HIGH_SE_REG = 0x5,
    HIGH_LD_IMM = 0x6,
    HIGH_ADD_IMM = 0x7,
    HIGH_ALU = 0x8,
    HIGH_SNE_REG = 0x9,
    HIGH_LD_I = 0xA,
    HIGH_JP_V0 = 0xB,
    HIGH_RND = 0xC,
    HIGH_DRW = 0xD,
    HIGH_SKP = 0xE,
    HIGH_LD_SPECIAL = 0xF,
};

enum SYSOpcode
{
    SYS_CLS = 0x0E0,
    SYS_RET = 0x0EE,
};

enum ALUOpcode
{
    ALU_LD = 0x0,
    ALU_OR = 0x1,
    ALU_AND = 0x2,
    ALU_XOR = 0x3,
    ALU_ADD = 0x4,
    ALU_SUB = 0x5,
    ALU_SHR = 0x6,
    ALU_SUBN = 0x7,
    ALU_SHL = 0xE,
};

enum SKPOpcode
{
    SKP_KEY = 0x9E,
    SKNP_KEY = 0xA1,
};

enum SPECIALOpcode
{
    SPECIAL_GET_DELAY = 0x07,
    SPECIAL_KEYWAIT = 0x0A,
    SPECIAL_SET_DELAY = 0x15,
    SPECIAL_SET_SOUND = 0x18,
    SPECIAL_ADD_INDEX = 0x1E,
    SPECIAL_LD_DIGIT = 0x29,
    SPECIAL_LD_BCD = 0x33,
    SPECIAL_LD_IVX = 0x55,
    SPECIAL_LD_VXI = 0x65,
};

Operation decodeSys(uint16_t sysOpcode)
{
    switch(sysOpcode) {
        case SYS_CLS: return INSN_CLS;
        case SYS_RET: return INSN_RET;
        default: return INSN_UNKNOWN; // 0nnn SYS addr is not supported
    }
}

Operation decodeALU(uint8_t aluOpcode)
{
    switch(aluOpcode) {
        case ALU_LD: return INSN_LD_REG;
        case ALU_OR: return INSN_OR;
        case ALU_AND: return INSN_AND;
        case ALU_XOR: return INSN_XOR;
        case ALU_ADD: return INSN_ADD_REG;
        case ALU_SUB: return INSN_SUB;
        case ALU_SHR: return INSN_SHR;
        case ALU_SUBN: return INSN_SUBN;
        case ALU_SHL: return INSN_SHL;
        default: return INSN_UNKNOWN;
    }
}

Operation decodeSkip(uint8_t skipOpcode)
{
    switch(skipOpcode) {
        case SKP_KEY: return INSN_SKP;
        case SKNP_KEY: return INSN_SKNP;
        default: return INSN_UNKNOWN;
    }
}

Operation decodeSpecial(uint8_t specialOpcode)
{
    switch(specialOpcode) {
        case SPECIAL_GET_DELAY: return INSN_LD_VX_DT;
        case SPECIAL_KEYWAIT: return INSN_LD_VX_K;
        case SPECIAL_SET_DELAY: return INSN_LD_DT_VX;
        case SPECIAL_SET_SOUND: return INSN_LD_ST_VX;
        case SPECIAL_ADD_INDEX: return INSN_ADD_I_VX;
        case SPECIAL_LD_DIGIT: return INSN_LD_F_VX;
        case SPECIAL_LD_BCD: return INSN_LD_B_VX;
        case SPECIAL_LD_IVX: return INSN_LD_I_VX;
        case SPECIAL_LD_VXI: return INSN_LD_VX_I;
        default: return INSN_UNKNOWN;
    }
}

}

Instruction decode(uint16_t instructionWord)
{
    Instruction insn;
    insn.word = instructionWord;
    insn.x = (instructionWord & 0x0F00) >> 8;
    insn.y = (instructionWord & 0x00F0) >> 4;
    insn.n = instructionWord & 0x000F;
    insn.kk = instructionWord & 0x00FF;
    insn.nnn = instructionWord & 0x0FFF;

    int highNybble = instructionWord >> 12;

    switch(highNybble) {
        case HIGH_SYS: insn.operation = decodeSys(insn.nnn); break;
        case HIGH_JP: insn.operation = INSN_JP; break;
        case HIGH_CALL: insn.operation = INSN_CALL; break;
        case HIGH_SE_IMM: insn.operation = INSN_SE_IMM; break;
        case HIGH_SNE_IMM: insn.operation = INSN_SNE_IMM; break;
        case HIGH_SE_REG: insn.operation = INSN_SE_REG; break; // low nybble ignored
        case HIGH_LD_IMM: insn.operation = INSN_LD_IMM; break;
        case HIGH_ADD_IMM: insn.operation = INSN_ADD_IMM; break;
        case HIGH_ALU: insn.operation = decodeALU(insn.n); break;
        case HIGH_SNE_REG: insn.operation = INSN_SNE_REG; break; // low nybble ignored
        case HIGH_LD_I: insn.operation = INSN_LD_I; break;
        case HIGH_JP_V0: insn.operation = INSN_JP_V0; break;
        case HIGH_RND: insn.operation = INSN_RND; break;
        case HIGH_DRW: insn.operation = INSN_DRW; break;
        case HIGH_SKP: insn.operation = decodeSkip(insn.kk); break;
        case HIGH_LD_SPECIAL: insn.operation = decodeSpecial(insn.kk); break;
        default: insn.operation = INSN_UNKNOWN; break;
    }

    return insn;
}

std::string disassemble(uint16_t pc, uint16_t instructionWord)
{
    Instruction insn = decode(instructionWord);
    char operands[64];

    switch(insn.operation) {
        case INSN_CLS: snprintf(operands, sizeof(operands), "CLS"); break;
        case INSN_RET: snprintf(operands, sizeof(operands), "RET"); break;
        case INSN_JP: snprintf(operands, sizeof(operands), "JP %X", insn.nnn); break;
        case INSN_CALL: snprintf(operands, sizeof(operands), "CALL %X", insn.nnn); break;
        case INSN_SE_IMM: snprintf(operands, sizeof(operands), "SE V%X, %X", insn.x, insn.kk); break;
        case INSN_SNE_IMM: snprintf(operands, sizeof(operands), "SNE V%X, %X", insn.x, insn.kk); break;
        case INSN_SE_REG: snprintf(operands, sizeof(operands), "SE V%X, V%X", insn.x, insn.y); break;
        case INSN_LD_IMM: snprintf(operands, sizeof(operands), "LD V%X, %X", insn.x, insn.kk); break;
        case INSN_ADD_IMM: snprintf(operands, sizeof(operands), "ADD V%X, %X", insn.x, insn.kk); break;
        case INSN_LD_REG: snprintf(operands, sizeof(operands), "LD V%X, V%X", insn.x, insn.y); break;
        case INSN_OR: snprintf(operands, sizeof(operands), "OR V%X, V%X", insn.x, insn.y); break;
        case INSN_AND: snprintf(operands, sizeof(operands), "AND V%X, V%X", insn.x, insn.y); break;
        case INSN_XOR: snprintf(operands, sizeof(operands), "XOR V%X, V%X", insn.x, insn.y); break;
        case INSN_ADD_REG: snprintf(operands, sizeof(operands), "ADD V%X, V%X", insn.x, insn.y); break;
        case INSN_SUB: snprintf(operands, sizeof(operands), "SUB V%X, V%X", insn.x, insn.y); break;
        case INSN_SHR: snprintf(operands, sizeof(operands), "SHR V%X", insn.x); break;
        case INSN_SUBN: snprintf(operands, sizeof(operands), "SUBN V%X, V%X", insn.x, insn.y); break;
        case INSN_SHL: snprintf(operands, sizeof(operands), "SHL V%X", insn.x); break;
        case INSN_SNE_REG: snprintf(operands, sizeof(operands), "SNE V%X, V%X", insn.x, insn.y); break;
        case INSN_LD_I: snprintf(operands, sizeof(operands), "LD I, %X", insn.nnn); break;
        case INSN_JP_V0: snprintf(operands, sizeof(operands), "JP V0, %X", insn.nnn); break;
        case INSN_RND: snprintf(operands, sizeof(operands), "RND V%X, %X", insn.x, insn.kk); break;
        case INSN_DRW: snprintf(operands, sizeof(operands), "DRW V%X, V%X, %X", insn.x, insn.y, insn.n); break;
        case INSN_SKP: snprintf(operands, sizeof(operands), "SKP V%X", insn.x); break;
        case INSN_SKNP: snprintf(operands, sizeof(operands), "SKNP V%X", insn.x); break;
        case INSN_LD_VX_DT: snprintf(operands, sizeof(operands), "LD V%X, DT", insn.x); break;
        case INSN_LD_VX_K: snprintf(operands, sizeof(operands), "LD V%X, K", insn.x); break;
        case INSN_LD_DT_VX: snprintf(operands, sizeof(operands), "LD DT, V%X", insn.x); break;
        case INSN_LD_ST_VX: snprintf(operands, sizeof(operands), "LD ST, V%X", insn.x); break;
        case INSN_ADD_I_VX: snprintf(operands, sizeof(operands), "ADD I, V%X", insn.x); break;
        case INSN_LD_F_VX: snprintf(operands, sizeof(operands), "LD F, V%X", insn.x); break;
        case INSN_LD_B_VX: snprintf(operands, sizeof(operands), "LD B, V%X", insn.x); break;
        case INSN_LD_I_VX: snprintf(operands, sizeof(operands), "LD [I], V%X", insn.x); break;
        case INSN_LD_VX_I: snprintf(operands, sizeof(operands), "LD V%X, [I]", insn.x); break;
        case INSN_UNKNOWN: snprintf(operands, sizeof(operands), "???"); break;
    }

    char line[96];
    snprintf(line, sizeof(line), "%04X: (%04X) %s", pc, instructionWord, operands);
    return line;
}
