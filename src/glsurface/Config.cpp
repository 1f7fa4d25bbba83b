#include "Config.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

// Digits only: no sign, no whitespace.
int parseNumber(const std::string& option, const std::string& value, int minimum) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument(option + ": expected a number, got '" + value + "'");
    }
    int n = 0;
    try {
        n = std::stoi(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(option + ": number out of range, got " + value);
    }
    if (n < minimum) {
        throw std::invalid_argument(option + ": must be at least " + std::to_string(minimum) +
                                    ", got " + value);
    }
    return n;
}

int parsePositive(const std::string& option, const std::string& value) {
    return parseNumber(option, value, 1);
}

void parseGlVersion(const std::string& value, WindowConfig& window) {
    auto dot = value.find('.');
    if (dot == std::string::npos) {
        throw std::invalid_argument("--gl: expected MAJOR.MINOR, got '" + value + "'");
    }
    window.glMajor = parsePositive("--gl", value.substr(0, dot));
    window.glMinor = parseNumber("--gl", value.substr(dot + 1), 0);
    if (window.glMajor < 3 || (window.glMajor == 3 && window.glMinor < 3)) {
        throw std::invalid_argument("--gl: a core profile needs at least 3.3, got " + value);
    }
}

std::string joinPath(const std::string& dir, const std::string& file) {
    if (dir.empty()) return file;
    if (dir.back() == '/') return dir + file;
    return dir + "/" + file;
}

} // namespace

std::string SurfaceConfig::vertexShaderPath() const {
    return joinPath(shaderDir, vertexShader);
}

std::string SurfaceConfig::fragmentShaderPath() const {
    return joinPath(shaderDir, fragmentShader);
}

SurfaceConfig parseArgs(int argc, const char* const* argv) {
    SurfaceConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + ": missing value");
            }
            return argv[++i];
        };

        if (arg == "--width") {
            config.window.width = parsePositive(arg, value());
        } else if (arg == "--height") {
            config.window.height = parsePositive(arg, value());
        } else if (arg == "--title") {
            config.window.title = value();
        } else if (arg == "--gl") {
            parseGlVersion(value(), config.window);
        } else if (arg == "--no-vsync") {
            config.window.vsync = false;
        } else if (arg == "--shaders") {
            config.shaderDir = value();
        } else if (arg == "--animate") {
            config.animate = true;
        } else if (arg == "--frames") {
            config.maxFrames = parsePositive(arg, value());
        } else if (arg == "--screenshot") {
            config.screenshotPath = value();
            if (config.screenshotPath.empty()) {
                throw std::invalid_argument("--screenshot: empty path");
            }
        } else if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else {
            throw std::invalid_argument("unknown option '" + arg + "'");
        }
    }

    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --width N          window width (default 800)\n"
        << "  --height N         window height (default 600)\n"
        << "  --title TEXT       window title\n"
        << "  --gl MAJOR.MINOR   core profile version (default 3.3)\n"
        << "  --no-vsync         disable vertical sync\n"
        << "  --shaders DIR      directory holding shader.vert and shader.frag\n"
        << "  --animate          rotate the clear color hue\n"
        << "  --frames N         stop after N drawn frames\n"
        << "  --screenshot PATH  save the first frame as PNG and exit\n"
        << "  --help             show this message\n";
    return out.str();
}
