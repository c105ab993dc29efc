#include <cctype>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "config.h"

namespace {

std::map<std::string, uint32_t> colorsByName = {
    {"aquamarine", 0x7fffd4},
    {"black", 0x000000},
    {"coral", 0xFF7F50},
    {"deeppink", 0xFF1493},
    {"gray", 0x808080},
    {"hotpink", 0xFF69B4},
    {"lavender", 0xE6E6FA},
    {"lightcyan", 0xE0FFFF},
    {"lightgray", 0xD3D3D3},
    {"navy", 0x000080},
    {"powderblue", 0xB0E0E6},
    {"red", 0xFF0000},
    {"white", 0xFFFFFF},
};

uint32_t expand12BitColorTo24(uint32_t color)
{
    uint8_t r = (color & 0xF00) >> 8;
    r = (r << 4) | r;
    uint8_t g = (color & 0x0F0) >> 4;
    g = (g << 4) | g;
    uint8_t b = (color & 0x00F) >> 0;
    b = (b << 4) | b;
    return (r << 16) | (g << 8) | (b << 0);
}

bool isHexString(const std::string& s)
{
    if(s.empty()) {
        return false;
    }
    for(char c : s) {
        if(!isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}

KeyMap defaultKeyMap()
{
    return {
        {'1', 0x1}, {'2', 0x2}, {'3', 0x3}, {'4', 0xC},
        {'Q', 0x4}, {'W', 0x5}, {'E', 0x6}, {'R', 0xD},
        {'A', 0x7}, {'S', 0x8}, {'D', 0x9}, {'F', 0xE},
        {'Z', 0xA}, {'X', 0x0}, {'C', 0xB}, {'V', 0xF},
    };
}

vec3ub vec3ubFromInts(int r, int g, int b)
{
    return { (uint8_t)r, (uint8_t)g, (uint8_t)b };
}

vec3ub parseColor(const std::string& name)
{
    std::string digits = name;
    if(!digits.empty() && (digits[0] == '#')) {
        digits = digits.substr(1);
    }

    uint32_t color;
    if(isHexString(digits) && ((digits.length() == 3) || (digits.length() == 6))) {
        color = strtoul(digits.c_str(), nullptr, 16);
        if(digits.length() == 3) { // Just three hex digits
            color = expand12BitColorTo24(color);
        }
    } else {
        auto found = colorsByName.find(name);
        if(found == colorsByName.end()) {
            throw std::runtime_error("unknown color \"" + name + "\"");
        }
        color = found->second;
    }

    return vec3ubFromInts((color >> 16) & 0xff, (color >> 8) & 0xff, color & 0xff);
}

int parseHostKey(const std::string& name)
{
    if(name == "space") {
        return ' ';
    }
    if((name.length() == 1) && isalnum(static_cast<unsigned char>(name[0]))) {
        return toupper(static_cast<unsigned char>(name[0]));
    }
    throw std::runtime_error("unknown host key \"" + name + "\"");
}

uint8_t parseLogicalKey(const nlohmann::json& value)
{
    if(value.is_number_integer()) {
        bool inRange = value.is_number_unsigned() ?
            (value.get<uint64_t>() <= 0xF) :
            ((value.get<int64_t>() >= 0) && (value.get<int64_t>() <= 0xF));
        if(!inRange) {
            throw std::runtime_error("logical key " + value.dump() + " out of range 0-15");
        }
        return value.get<uint8_t>();
    }
    if(value.is_string()) {
        std::string digit = value.get<std::string>();
        if((digit.length() == 1) && isHexString(digit)) {
            return strtoul(digit.c_str(), nullptr, 16);
        }
    }
    throw std::runtime_error("logical key " + value.dump() + " is not 0-15 or a hex digit");
}

void applyConfig(const nlohmann::json& options, Config& config)
{
    if(!options.is_object()) {
        throw std::runtime_error("configuration must be a JSON object");
    }

    if(options.contains("rate")) {
        const auto& rate = options["rate"];
        int ticksPerField;
        if(rate.type() == nlohmann::json::value_t::string) {
            ticksPerField = atoi(rate.get<std::string>().c_str());
        } else if(rate.is_number_integer()) {
            if(!rate.is_number_unsigned() && (rate.get<int64_t>() <= 0)) {
                ticksPerField = 0;
            } else if(rate.get<uint64_t>() > INT_MAX) {
                throw std::runtime_error("rate: " + rate.dump() + " is too large");
            } else {
                ticksPerField = rate.get<int>();
            }
        } else {
            throw std::runtime_error("rate: expected an integer, got " + rate.dump());
        }
        if(ticksPerField <= 0) {
            throw std::runtime_error("rate: must be a positive number of cycles per field");
        }
        config.ticksPerField = ticksPerField;
    }

    if(options.contains("colors")) {
        if(!options["colors"].is_object()) {
            throw std::runtime_error("colors: expected an object");
        }
        for(const auto& [index, color] : options["colors"].items()) {
            if((index != "0") && (index != "1")) {
                throw std::runtime_error("colors: index \"" + index + "\" is not 0 or 1");
            }
            if(!color.is_string()) {
                throw std::runtime_error("colors: color " + index + " must be a string");
            }
            int colorIndex = (index == "1") ? 1 : 0;
            config.colorTable[colorIndex] = parseColor(color.get<std::string>());
        }
    }

    if(options.contains("keymap")) {
        if(!options["keymap"].is_object()) {
            throw std::runtime_error("keymap: expected an object");
        }
        KeyMap keymap;
        for(const auto& [hostKey, logicalKey] : options["keymap"].items()) {
            try {
                keymap[parseHostKey(hostKey)] = parseLogicalKey(logicalKey);
            } catch(const std::runtime_error& e) {
                throw std::runtime_error(std::string("keymap: ") + e.what());
            }
        }
        config.keymap = keymap;
    }
}

void loadConfig(const std::string& filename, Config& config)
{
    std::ifstream configFile(filename);
    if(!configFile) {
        throw std::runtime_error("couldn't open configuration file \"" + filename + "\"");
    }
    nlohmann::json options;
    configFile >> options;
    applyConfig(options, config);
}
