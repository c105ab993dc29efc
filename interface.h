#pragma once

#include <array>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <MiniFB.h>

#include "config.h"
#include "framebuffer.h"

// Window presenting a Framebuffer, plus the host keyboard state.
struct Interface
{
    Framebuffer& framebuffer;
    std::array<vec3ub, 2> colorTable;
    bool closed = false;
    std::set<int> hostKeysHeld;

    bool succeeded = false;

    static constexpr int initialScaleFactor = 10;

    mfb_window *window = nullptr;
    int windowWidth;
    int windowHeight;
    std::vector<uint32_t> windowBuffer;

    Interface(const std::string& name, Framebuffer& framebuffer, const std::array<vec3ub, 2>& colorTable);

    bool redraw();
    void resize(int width, int height);
    void keyboard(mfb_key key, bool isPressed);
    bool iterate();

    // Logical keys whose host keys are currently held.
    std::vector<uint8_t> pressedKeys(const KeyMap& keymap) const;

    static void resizecb(mfb_window *window, int width, int height);
    static void keyboardcb(mfb_window *window, mfb_key key, mfb_key_mod mod, bool isPressed);
};
