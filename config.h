#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

typedef std::array<uint8_t, 3> vec3ub;

// Host key code to logical key 0-F.  Host codes are MiniFB's, which are
// ASCII for letters, digits and space.
typedef std::map<int, uint8_t> KeyMap;

KeyMap defaultKeyMap();

struct Config
{
    int ticksPerField = 2;
    std::array<vec3ub, 2> colorTable = {{ {0, 0, 0}, {255, 255, 255} }};
    KeyMap keymap = defaultKeyMap();
};

vec3ub vec3ubFromInts(int r, int g, int b);

// Accepts RRGGBB, RGB, either with a leading '#', or a color name.
// Throws std::runtime_error on anything else.
vec3ub parseColor(const std::string& name);

// A single letter or digit, or "space".  Throws std::runtime_error.
int parseHostKey(const std::string& name);

// An integer 0-15 or a single hex digit string.  Throws std::runtime_error.
uint8_t parseLogicalKey(const nlohmann::json& value);

void applyConfig(const nlohmann::json& options, Config& config);

// Throws std::runtime_error if the file can't be read, and
// nlohmann::json::exception if it isn't valid JSON.
void loadConfig(const std::string& filename, Config& config);
