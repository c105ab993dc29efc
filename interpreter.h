#pragma once

#include <cstdio>
#include <cstdint>
#include <exception>
#include <random>
#include <vector>

#include "debug.h"
#include "instruction.h"
#include "keypad.h"
#include "machine.h"

// SURFACE must provide
//     void clear();
//     bool draw(uint32_t x, uint32_t y, const uint8_t *sprite, size_t rows);
//     void setPixel(uint32_t x, uint32_t y, bool on);
//     bool getPixel(uint32_t x, uint32_t y);
// KEYPAD must provide
//     void setPressed(const std::vector<uint8_t>& keys);
//     bool isDown(uint8_t key);
// RANDOM is default constructed and called for each Cxkk; it may throw
// std::exception when no random byte is available.
template <class SURFACE, class KEYPAD, class RANDOM = std::random_device>
struct Interpreter
{
    MachineState state;
    SURFACE& surface;
    KEYPAD& keypad;

    uint64_t clock = 0;

    RANDOM randomSource;

    Interpreter(SURFACE& surface, KEYPAD& keypad) :
        surface(surface),
        keypad(keypad)
    {
    }

    void reset()
    {
        state.reset();
        surface.clear();
        clock = 0;
    }

    bool load(const std::vector<uint8_t>& program)
    {
        if(!state.load(program)) {
            fprintf(stderr, "program of %zu bytes does not fit in %d bytes at %03X\n", program.size(), MAX_PROGRAM_SIZE, PROGRAM_START);
            return false;
        }
        return true;
    }

    void setPressed(const std::vector<uint8_t>& keys)
    {
        keypad.setPressed(keys);
    }

    void tick()
    {
        if(state.DT > 0) {
            state.DT--;
        }
        if(state.ST > 0) {
            state.ST--;
        }
    }

    uint16_t readU16(uint16_t addr)
    {
        uint8_t hiByte = state.memory[addr];
        uint8_t loByte = state.memory[addr + 1];
        return hiByte * 256 + loByte;
    }

    // Executes one instruction and ticks the timers.  A fault other than
    // UNSUPPORTED_INSTRUCTION leaves the machine state untouched;
    // UNSUPPORTED_INSTRUCTION moves pc past the offending word.  Timers
    // only tick on CONTINUE.
    StepResult step()
    {
        uint16_t pc = state.pc;

        if(pc + 1 >= MEMORY_SIZE) {
            fprintf(stderr, "%04X: program counter out of range\n", pc);
            return {ADDRESS_OUT_OF_RANGE, pc, 0};
        }

        uint16_t instructionWord = readU16(pc);
        Instruction insn = decode(instructionWord);
        auto& registers = state.registers;
        auto& memory = state.memory;
        uint8_t& vx = registers[insn.x];
        uint8_t& vy = registers[insn.y];

        if(debug & DEBUG_STATE) {
            printf("CHIP8: clk:%llu pc:%04X I:%04X ", (unsigned long long)clock, pc, state.I);
            for(int i = 0; i < 16; i++) {
                printf("%02X ", registers[i]);
            }
            puts("");
        }

        if(debug & DEBUG_ASM) {
            puts(disassemble(pc, instructionWord).c_str());
        }

        uint16_t nextPC = pc + 2;

        switch(insn.operation) {
            case INSN_CLS: { // 00E0 - CLS - Clear the display.
                surface.clear();
                break;
            }
            case INSN_RET: { // 00EE - RET - Return from a subroutine.  The stack holds the address of the CALL itself, so resume 2 bytes past it.
                if(state.sp == 0) {
                    fprintf(stderr, "%04X: RET with empty stack\n", pc);
                    return {STACK_UNDERFLOW, pc, instructionWord};
                }
                state.sp--;
                nextPC = state.stack[state.sp] + 2;
                state.stack[state.sp] = RETURN_SENTINEL;
                break;
            }
            case INSN_JP: { // 1nnn - JP addr - Jump to location nnn.
                nextPC = insn.nnn;
                break;
            }
            case INSN_CALL: { // 2nnn - CALL addr - Call subroutine at nnn.  The current PC goes on the top of the stack.
                if(state.sp >= STACK_DEPTH) {
                    fprintf(stderr, "%04X: CALL with full stack\n", pc);
                    return {STACK_OVERFLOW, pc, instructionWord};
                }
                state.stack[state.sp] = pc;
                state.sp++;
                nextPC = insn.nnn;
                break;
            }
            case INSN_SE_IMM: { // 3xkk - SE Vx, byte - Skip next instruction if Vx = kk.
                if(vx == insn.kk) {
                    nextPC += 2;
                }
                break;
            }
            case INSN_SNE_IMM: { // 4xkk - SNE Vx, byte - Skip next instruction if Vx != kk.
                if(vx != insn.kk) {
                    nextPC += 2;
                }
                break;
            }
            case INSN_SE_REG: { // 5xy0 - SE Vx, Vy - Skip next instruction if Vx = Vy.
                if(vx == vy) {
                    nextPC += 2;
                }
                break;
            }
            case INSN_LD_IMM: { // 6xkk - LD Vx, byte - Set Vx = kk.
                vx = insn.kk;
                break;
            }
            case INSN_ADD_IMM: { // 7xkk - ADD Vx, byte - Set Vx = Vx + kk.  No carry.
                vx = vx + insn.kk;
                break;
            }
            case INSN_LD_REG: { // 8xy0 - LD Vx, Vy - Set Vx = Vy.
                vx = vy;
                break;
            }
            case INSN_OR: { // 8xy1 - OR Vx, Vy - Set Vx = Vx OR Vy.
                vx |= vy;
                break;
            }
            case INSN_AND: { // 8xy2 - AND Vx, Vy - Set Vx = Vx AND Vy.
                vx &= vy;
                break;
            }
            case INSN_XOR: { // 8xy3 - XOR Vx, Vy - Set Vx = Vx XOR Vy.
                vx ^= vy;
                break;
            }
            case INSN_ADD_REG: { // 8xy4 - ADD Vx, Vy - Set Vx = Vx + Vy.  VF = 1 on carry; VF is left alone when there is no carry.
                uint16_t sum = vx + vy;
                if(sum > 0xFF) {
                    registers[0xF] = 1;
                }
                vx = sum & 0xFF;
                break;
            }
            case INSN_SUB: { // 8xy5 - SUB Vx, Vy - Set Vx = Vx - Vy.  VF = 1 if Vx > Vy, otherwise 0.
                uint8_t result = vx - vy;
                registers[0xF] = (vx > vy) ? 1 : 0;
                vx = result;
                break;
            }
            case INSN_SHR: { // 8xy6 - SHR Vx - VF = least significant bit of Vx, then Vx = Vx SHR 1.
                registers[0xF] = vx & 0x1;
                vx >>= 1;
                break;
            }
            case INSN_SUBN: { // 8xy7 - SUBN Vx, Vy - Set Vx = Vy - Vx.  VF = 0 on borrow, otherwise 1.
                uint8_t result = vy - vx;
                registers[0xF] = (vy < vx) ? 0 : 1;
                vx = result;
                break;
            }
            case INSN_SHL: { // 8xyE - SHL Vx - VF = Vx AND 0x80 (0x80, not 1, when the top bit is set), then Vx = Vx SHL 1.
                registers[0xF] = vx & 0x80;
                vx <<= 1;
                break;
            }
            case INSN_SNE_REG: { // 9xy0 - SNE Vx, Vy - Skip next instruction if Vx != Vy.
                if(vx != vy) {
                    nextPC += 2;
                }
                break;
            }
            case INSN_LD_I: { // Annn - LD I, addr - Set I = nnn.
                state.I = insn.nnn;
                break;
            }
            case INSN_JP_V0: { // Bnnn - JP V0, addr - Jump to location nnn + V0.
                nextPC = insn.nnn + registers[0];
                break;
            }
            case INSN_RND: { // Cxkk - RND Vx, byte - Set Vx = random byte AND kk.
                uint8_t randomByte;
                try {
                    randomByte = randomSource() & 0xFF;
                } catch(const std::exception& e) {
                    fprintf(stderr, "%04X: random source failed: %s\n", pc, e.what());
                    return {RANDOM_SOURCE_FAILED, pc, instructionWord};
                }
                vx = randomByte & insn.kk;
                break;
            }
            case INSN_DRW: { // Dxyn - DRW Vx, Vy, nibble - Display n-byte sprite starting at memory location I at (Vx, Vy), set VF = collision.
                if((state.I >= MEMORY_SIZE) || (state.I + insn.n > MEMORY_SIZE)) {
                    fprintf(stderr, "%04X: sprite at %04X runs past end of memory\n", pc, state.I);
                    return {ADDRESS_OUT_OF_RANGE, pc, instructionWord};
                }
                bool collided = surface.draw(vx, vy, &memory[state.I], insn.n);
                registers[0xF] = collided ? 1 : 0;
                break;
            }
            case INSN_SKP: { // Ex9E - SKP Vx - Skip next instruction if key with the value of Vx is pressed.
                if(vx >= KEY_COUNT) {
                    fprintf(stderr, "%04X: key %d out of range\n", pc, vx);
                    return {KEY_OUT_OF_RANGE, pc, instructionWord};
                }
                if(keypad.isDown(vx)) {
                    if(debug & DEBUG_KEYS) {
                        printf("clock %llu, pc %04X, SKP_KEY, key %d pressed\n", (unsigned long long)clock, pc, vx);
                    }
                    nextPC += 2;
                }
                break;
            }
            case INSN_SKNP: { // ExA1 - SKNP Vx - Skip next instruction if key with the value of Vx is not pressed.
                if(vx >= KEY_COUNT) {
                    fprintf(stderr, "%04X: key %d out of range\n", pc, vx);
                    return {KEY_OUT_OF_RANGE, pc, instructionWord};
                }
                if(!keypad.isDown(vx)) {
                    nextPC += 2;
                } else {
                    if(debug & DEBUG_KEYS) {
                        printf("clock %llu, pc %04X, SKNP_KEY, key %d pressed\n", (unsigned long long)clock, pc, vx);
                    }
                }
                break;
            }
            case INSN_LD_VX_DT: { // Fx07 - LD Vx, DT - Set Vx = delay timer value.
                vx = state.DT;
                break;
            }
            case INSN_LD_VX_K: { // Fx0A - LD Vx, K - Polls once per step instead of blocking.  Every held key, scanned from 0 to F, loads Vx and advances PC by 2.
                for(uint8_t key = 0; key < KEY_COUNT; key++) {
                    if(keypad.isDown(key)) {
                        if(debug & DEBUG_KEYS) {
                            printf("key wait saw key %d\n", key);
                        }
                        vx = key;
                        nextPC += 2;
                    }
                }
                break;
            }
            case INSN_LD_DT_VX: { // Fx15 - LD DT, Vx - Set delay timer = Vx.
                state.DT = vx;
                break;
            }
            case INSN_LD_ST_VX: { // Fx18 - LD ST, Vx - Set sound timer = Vx.
                state.ST = vx;
                break;
            }
            case INSN_ADD_I_VX: { // Fx1E - ADD I, Vx - Set I = I + Vx.  VF unaffected.
                state.I += vx;
                break;
            }
            case INSN_LD_F_VX: { // Fx29 - LD F, Vx - Set I = location of sprite for digit Vx.
                state.I = vx * DIGIT_SPRITE_SIZE;
                break;
            }
            case INSN_LD_B_VX: { // Fx33 - LD B, Vx - Store hundreds, tens and ones of Vx at I, I+1 and I+2.
                if(state.I + 2 >= MEMORY_SIZE) {
                    fprintf(stderr, "%04X: BCD store at %04X runs past end of memory\n", pc, state.I);
                    return {ADDRESS_OUT_OF_RANGE, pc, instructionWord};
                }
                memory[state.I + 0] = vx / 100;
                memory[state.I + 1] = (vx / 10) % 10;
                memory[state.I + 2] = vx % 100 % 10;
                break;
            }
            case INSN_LD_I_VX: { // Fx55 - LD [I], Vx - Store registers V0 through Vx in memory starting at location I.  I is not changed.
                if(state.I + insn.x >= MEMORY_SIZE) {
                    fprintf(stderr, "%04X: register store at %04X runs past end of memory\n", pc, state.I);
                    return {ADDRESS_OUT_OF_RANGE, pc, instructionWord};
                }
                for(int i = 0; i <= insn.x; i++) {
                    memory[state.I + i] = registers[i];
                }
                break;
            }
            case INSN_LD_VX_I: { // Fx65 - LD Vx, [I] - Read registers V0 through Vx from memory starting at location I.  I is not changed.
                if(state.I + insn.x >= MEMORY_SIZE) {
                    fprintf(stderr, "%04X: register load at %04X runs past end of memory\n", pc, state.I);
                    return {ADDRESS_OUT_OF_RANGE, pc, instructionWord};
                }
                for(int i = 0; i <= insn.x; i++) {
                    registers[i] = memory[state.I + i];
                }
                break;
            }
            case INSN_UNKNOWN: {
                fprintf(stderr, "%04X: unsupported instruction %04X\n", pc, instructionWord);
                state.pc = nextPC;
                return {UNSUPPORTED_INSTRUCTION, pc, instructionWord};
            }
        }

        state.pc = nextPC;
        tick();
        clock++;
        return {CONTINUE, pc, instructionWord};
    }
};
