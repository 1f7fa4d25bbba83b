#ifndef GLSURFACE_PNGWRITER_H
#define GLSURFACE_PNGWRITER_H

#include <cstdint>
#include <string>
#include <vector>

// Reverses row order in place. GL reads pixels bottom-up, PNG stores them top-down.
void flipRows(std::vector<std::uint8_t>& rgba, int width, int height);

// 8-bit RGBA, rows top to bottom, tightly packed.
std::vector<std::uint8_t> encodePng(int width, int height, const std::vector<std::uint8_t>& rgba);

void writePng(const std::string& path, int width, int height, const std::vector<std::uint8_t>& rgba);

#endif
