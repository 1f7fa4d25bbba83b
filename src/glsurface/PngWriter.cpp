#include "PngWriter.h"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>

namespace {

constexpr std::array<std::uint8_t, 8> kSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

void putU32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(std::uint8_t(v >> 24));
    out.push_back(std::uint8_t(v >> 16));
    out.push_back(std::uint8_t(v >> 8));
    out.push_back(std::uint8_t(v));
}

// length | type | data | crc(type + data)
void putChunk(std::vector<std::uint8_t>& out, const char* type, const std::vector<std::uint8_t>& data) {
    putU32(out, static_cast<std::uint32_t>(data.size()));

    std::size_t typeOffset = out.size();
    out.insert(out.end(), type, type + 4);
    out.insert(out.end(), data.begin(), data.end());

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, out.data() + typeOffset, static_cast<uInt>(4 + data.size()));
    putU32(out, static_cast<std::uint32_t>(crc));
}

} // namespace

void flipRows(std::vector<std::uint8_t>& rgba, int width, int height) {
    const std::size_t stride = std::size_t(width) * 4;
    if (rgba.size() != stride * std::size_t(height)) {
        throw std::invalid_argument("flipRows: pixel buffer does not match image size");
    }
    for (int top = 0, bottom = height - 1; top < bottom; ++top, --bottom) {
        std::swap_ranges(rgba.begin() + top * stride,
                         rgba.begin() + (top + 1) * stride,
                         rgba.begin() + bottom * stride);
    }
}

std::vector<std::uint8_t> encodePng(int width, int height, const std::vector<std::uint8_t>& rgba) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("encodePng: image size must be positive");
    }
    const std::size_t stride = std::size_t(width) * 4;
    if (rgba.size() != stride * std::size_t(height)) {
        throw std::invalid_argument("encodePng: pixel buffer does not match image size");
    }

    // Each scanline is prefixed with filter type 0 (None).
    std::vector<std::uint8_t> raw;
    raw.reserve((stride + 1) * std::size_t(height));
    for (int y = 0; y < height; ++y) {
        raw.push_back(0);
        raw.insert(raw.end(), rgba.begin() + y * stride, rgba.begin() + (y + 1) * stride);
    }

    uLongf compressedSize = compressBound(static_cast<uLong>(raw.size()));
    std::vector<std::uint8_t> compressed(compressedSize);
    int rc = compress2(compressed.data(), &compressedSize,
                       raw.data(), static_cast<uLong>(raw.size()), Z_BEST_COMPRESSION);
    if (rc != Z_OK) {
        throw std::runtime_error("encodePng: zlib compress2 failed with code " + std::to_string(rc));
    }
    compressed.resize(compressedSize);

    std::vector<std::uint8_t> ihdr;
    putU32(ihdr, static_cast<std::uint32_t>(width));
    putU32(ihdr, static_cast<std::uint32_t>(height));
    ihdr.push_back(8); // bit depth
    ihdr.push_back(6); // color type RGBA
    ihdr.push_back(0); // compression
    ihdr.push_back(0); // filter
    ihdr.push_back(0); // interlace

    std::vector<std::uint8_t> png(kSignature.begin(), kSignature.end());
    putChunk(png, "IHDR", ihdr);
    putChunk(png, "IDAT", compressed);
    putChunk(png, "IEND", {});
    return png;
}

void writePng(const std::string& path, int width, int height, const std::vector<std::uint8_t>& rgba) {
    std::vector<std::uint8_t> png = encodePng(width, height, rgba);

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + path + " for writing");
    }
    file.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
    if (!file) {
        throw std::runtime_error("Failed to write " + path);
    }
}
