#include <gtest/gtest.h>

#include "instruction.h"

TEST(DecodeTest, SplitsFields)
{
    Instruction insn = decode(0xD12F);

    EXPECT_EQ(insn.operation, INSN_DRW);
    EXPECT_EQ(insn.word, 0xD12F);
    EXPECT_EQ(insn.x, 0x1);
    EXPECT_EQ(insn.y, 0x2);
    EXPECT_EQ(insn.n, 0xF);
    EXPECT_EQ(insn.kk, 0x2F);
    EXPECT_EQ(insn.nnn, 0x12F);
}

TEST(DecodeTest, RecognizesEveryOperation)
{
    struct {
        uint16_t word;
        Operation operation;
    } cases[] = {
        {0x00E0, INSN_CLS},
        {0x00EE, INSN_RET},
        {0x1234, INSN_JP},
        {0x2345, INSN_CALL},
        {0x3456, INSN_SE_IMM},
        {0x4567, INSN_SNE_IMM},
        {0x5670, INSN_SE_REG},
        {0x6789, INSN_LD_IMM},
        {0x789A, INSN_ADD_IMM},
        {0x8120, INSN_LD_REG},
        {0x8121, INSN_OR},
        {0x8122, INSN_AND},
        {0x8123, INSN_XOR},
        {0x8124, INSN_ADD_REG},
        {0x8125, INSN_SUB},
        {0x8126, INSN_SHR},
        {0x8127, INSN_SUBN},
        {0x812E, INSN_SHL},
        {0x9120, INSN_SNE_REG},
        {0xA123, INSN_LD_I},
        {0xB123, INSN_JP_V0},
        {0xC1FF, INSN_RND},
        {0xD125, INSN_DRW},
        {0xE19E, INSN_SKP},
        {0xE1A1, INSN_SKNP},
        {0xF107, INSN_LD_VX_DT},
        {0xF10A, INSN_LD_VX_K},
        {0xF115, INSN_LD_DT_VX},
        {0xF118, INSN_LD_ST_VX},
        {0xF11E, INSN_ADD_I_VX},
        {0xF129, INSN_LD_F_VX},
        {0xF133, INSN_LD_B_VX},
        {0xF155, INSN_LD_I_VX},
        {0xF165, INSN_LD_VX_I},
    };

    for(const auto& c : cases) {
        EXPECT_EQ(decode(c.word).operation, c.operation) << std::hex << c.word;
    }
}

TEST(DecodeTest, UnknownWords)
{
    for(uint16_t word : {0x0000, 0x0123, 0x00E1, 0x8128, 0x812F, 0xE100, 0xF100, 0xF1FF}) {
        EXPECT_EQ(decode(word).operation, INSN_UNKNOWN) << std::hex << word;
    }
}

TEST(DecodeTest, RegisterComparesIgnoreLowNybble)
{
    EXPECT_EQ(decode(0x5127).operation, INSN_SE_REG);
    EXPECT_EQ(decode(0x912F).operation, INSN_SNE_REG);
}

TEST(DisassembleTest, FormatsAddressWordAndMnemonic)
{
    EXPECT_EQ(disassemble(0x200, 0x00E0), "0200: (00E0) CLS");
    EXPECT_EQ(disassemble(0x202, 0x2ABC), "0202: (2ABC) CALL ABC");
    EXPECT_EQ(disassemble(0x204, 0x6A2F), "0204: (6A2F) LD VA, 2F");
    EXPECT_EQ(disassemble(0x206, 0x8124), "0206: (8124) ADD V1, V2");
    EXPECT_EQ(disassemble(0x208, 0xD125), "0208: (D125) DRW V1, V2, 5");
    EXPECT_EQ(disassemble(0x20A, 0xF30A), "020A: (F30A) LD V3, K");
    EXPECT_EQ(disassemble(0x20C, 0xF255), "020C: (F255) LD [I], V2");
    EXPECT_EQ(disassemble(0x20E, 0xF265), "020E: (F265) LD V2, [I]");
}

TEST(DisassembleTest, UnknownWord)
{
    EXPECT_EQ(disassemble(0x300, 0x0123), "0300: (0123) ???");
}
