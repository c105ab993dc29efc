#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.h"
#include "debug.h"
#include "framebuffer.h"
#include "interface.h"
#include "interpreter.h"
#include "keypad.h"

void usage(const char *name)
{
    fprintf(stderr, "usage: %s [options] ROM.ch8\n", name);
    fprintf(stderr, "options:\n");
    fprintf(stderr, "\t--rate N           - issue N instructions per 60Hz field\n");
    fprintf(stderr, "\t--config FILE      - read rate, colors and keymap from JSON FILE\n");
    fprintf(stderr, "\t--color N RRGGBB   - set color N (0 background, 1 foreground) to RRGGBB\n");
    fprintf(stderr, "\t--debug name       - enable debug output\n");
    fprintf(stderr, "\t                     \"state\" : registers before each instruction\n");
    fprintf(stderr, "\t                     \"asm\" : disassembly of each instruction\n");
    fprintf(stderr, "\t                     \"draw\" : every pixel drawn\n");
    fprintf(stderr, "\t                     \"keys\" : key presses, waits and skips\n");
    fprintf(stderr, "\t--keep-going       - don't stop on unsupported instructions\n");
}

bool readROM(const char *filename, std::vector<uint8_t>& program)
{
    FILE *fp = fopen(filename, "rb");
    if(fp == nullptr) {
        fprintf(stderr, "couldn't open ROM \"%s\"\n", filename);
        return false;
    }
    program.clear();
    uint8_t buffer[512];
    size_t count;
    while((count = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
        program.insert(program.end(), buffer, buffer + count);
    }
    bool failed = ferror(fp);
    fclose(fp);
    if(failed) {
        fprintf(stderr, "couldn't read ROM \"%s\"\n", filename);
        return false;
    }
    if(program.empty()) {
        fprintf(stderr, "ROM \"%s\" is empty\n", filename);
        return false;
    }
    return true;
}

int main(int argc, char **argv)
{
    const char *progname = argv[0];
    argc -= 1;
    argv += 1;

    Config config;
    bool keepGoing = false;

    while((argc > 0) && (argv[0][0] == '-')) {
        if(strcmp(argv[0], "--color") == 0) {
            if(argc < 3) {
                fprintf(stderr, "--color option requires a color number and color.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            int colorIndex = atoi(argv[1]);
            if((colorIndex < 0) || (colorIndex > 1)) {
                fprintf(stderr, "color number must be 0 or 1.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            try {
                config.colorTable[colorIndex] = parseColor(argv[2]);
            } catch(const std::runtime_error& e) {
                fprintf(stderr, "%s\n", e.what());
                exit(EXIT_FAILURE);
            }
            argv += 3;
            argc -= 3;
        } else if(strcmp(argv[0], "--config") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--config option requires a file name.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            try {
                loadConfig(argv[1], config);
            } catch(const nlohmann::json::exception& e) {
                fprintf(stderr, "%s: %s\n", argv[1], e.what());
                exit(EXIT_FAILURE);
            } catch(const std::runtime_error& e) {
                fprintf(stderr, "%s: %s\n", argv[1], e.what());
                exit(EXIT_FAILURE);
            }
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--debug") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--debug option requires a debug flag to enable.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            std::string debugKeyword = argv[1];
            if(keywordsToDebugFlags.count(debugKeyword) == 0) {
                fprintf(stderr, "unknown debug flag \"%s\".\n", argv[1]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            debug |= keywordsToDebugFlags.at(debugKeyword);
            fprintf(stderr, "debug value now 0x%02X\n", debug);
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--rate") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--rate option requires a rate number value.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            config.ticksPerField = atoi(argv[1]);
            if(config.ticksPerField <= 0) {
                fprintf(stderr, "rate must be a positive number.\n");
                exit(EXIT_FAILURE);
            }
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--keep-going") == 0) {
            keepGoing = true;
            argv += 1;
            argc -= 1;
        } else if(
            (strcmp(argv[0], "-help") == 0) ||
            (strcmp(argv[0], "-h") == 0) ||
            (strcmp(argv[0], "-?") == 0))
        {
            usage(progname);
            exit(EXIT_SUCCESS);
        } else {
            fprintf(stderr, "unknown parameter \"%s\"\n", argv[0]);
            usage(progname);
            exit(EXIT_FAILURE);
        }
    }

    if(argc < 1) {
        usage(progname);
        exit(EXIT_FAILURE);
    }

    std::vector<uint8_t> program;
    if(!readROM(argv[0], program)) {
        exit(EXIT_FAILURE);
    }

    Framebuffer framebuffer;
    Keypad keypad;

    std::filesystem::path base(argv[0]);
    Interface interface(base.filename().string(), framebuffer, config.colorTable);
    if(!interface.succeeded) {
        fprintf(stderr, "couldn't open a window\n");
        exit(EXIT_FAILURE);
    }

    Interpreter<Framebuffer,Keypad> chip8(framebuffer, keypad);
    chip8.reset();
    if(!chip8.load(program)) {
        exit(EXIT_FAILURE);
    }
    fprintf(stderr, "loaded %zu bytes from \"%s\"\n", program.size(), argv[0]);

    std::chrono::time_point<std::chrono::system_clock> interfaceThen = std::chrono::system_clock::now();

    bool done = false;
    while(!done) {

        chip8.setPressed(interface.pressedKeys(config.keymap));

        for(int i = 0; i < config.ticksPerField; i++) {
            StepResult result = chip8.step();
            if((result.status == UNSUPPORTED_INSTRUCTION) && keepGoing) {
                continue;
            }
            if(result.status != CONTINUE) {
                fprintf(stderr, "%04X: %s (instruction %04X), stopping\n", result.pc, stepStatusName(result.status), result.instructionWord);
                exit(EXIT_FAILURE);
            }
        }

        std::chrono::time_point<std::chrono::system_clock> interfaceNow;
        float dt;
        do {
            interfaceNow = std::chrono::system_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::duration<float>>(interfaceNow - interfaceThen);
            dt = elapsed.count();
        } while(dt < .0166f);

        done = !interface.iterate();
        interfaceThen = interfaceNow;
    }
}
