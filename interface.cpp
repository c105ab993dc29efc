#include <cstdio>

#include "debug.h"
#include "interface.h"

Interface::Interface(const std::string& name, Framebuffer& framebuffer, const std::array<vec3ub, 2>& colorTable) :
    framebuffer(framebuffer),
    colorTable(colorTable),
    windowWidth(Framebuffer::WIDTH * initialScaleFactor),
    windowHeight(Framebuffer::HEIGHT * initialScaleFactor)
{
    window = mfb_open_ex(name.c_str(), windowWidth, windowHeight, WF_RESIZABLE);
    if (window) {
        windowBuffer.resize(windowWidth * windowHeight);
        mfb_set_user_data(window, (void *) this);
        mfb_set_resize_callback(window, resizecb);
        mfb_set_keyboard_callback(window, keyboardcb);
        succeeded = true;
    }
}

bool Interface::redraw()
{
    for(int row = 0; row < windowHeight; row++) {
        for(int col = 0; col < windowWidth; col++) {
            int displayX = col * Framebuffer::WIDTH / windowWidth;
            int displayY = row * Framebuffer::HEIGHT / windowHeight;
            bool pixel = framebuffer.getPixel(displayX, displayY);
            auto &c = colorTable.at(pixel ? 1 : 0);
            windowBuffer[col + row * windowWidth] = MFB_RGB(c[0], c[1], c[2]);
        }
    }
    int status = mfb_update_ex(window, windowBuffer.data(), windowWidth, windowHeight);
    closed = (status < 0);
    return status >= 0;
}

void Interface::resize(int width, int height)
{
    windowWidth = width;
    windowHeight = height;
    windowBuffer.resize(windowWidth * windowHeight);
    framebuffer.displayChanged = true;
}

void Interface::resizecb(mfb_window *window, int width, int height)
{
    Interface *ifc = static_cast<Interface *>(mfb_get_user_data(window));
    ifc->resize(width, height);
    mfb_set_viewport(window, 0, 0, width, height);
}

void Interface::keyboard(mfb_key key, bool isPressed)
{
    if(key == KB_KEY_ESCAPE) {
        if(isPressed) {
            mfb_close(window);
            closed = true;
        }
        return;
    }
    if(debug & DEBUG_KEYS) {
        printf("host key %d %s\n", (int)key, isPressed ? "down" : "up");
    }
    if(isPressed) {
        hostKeysHeld.insert(key);
    } else {
        hostKeysHeld.erase(key);
    }
}

void Interface::keyboardcb(mfb_window *window, mfb_key key, mfb_key_mod mod, bool isPressed)
{
    Interface *ifc = static_cast<Interface *>(mfb_get_user_data(window));
    ifc->keyboard(key, isPressed);
}

bool Interface::iterate()
{
    bool success = true;
    if(framebuffer.displayChanged) {
        success = redraw();
        framebuffer.displayChanged = false;
    } else {
        success = (mfb_update_events(window) >= 0);
    }
    if(success) {
        mfb_wait_sync(window);
    }
    return success && !closed;
}

std::vector<uint8_t> Interface::pressedKeys(const KeyMap& keymap) const
{
    std::vector<uint8_t> keys;
    for(int hostKey : hostKeysHeld) {
        auto found = keymap.find(hostKey);
        if(found != keymap.end()) {
            keys.push_back(found->second);
        }
    }
    return keys;
}
