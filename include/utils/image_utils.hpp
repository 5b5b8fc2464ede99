#pragma once

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../error.hpp"

// Scaled channel value to a byte. Negative and NaN values saturate to 0,
// anything at or past 256 means the color math upstream is broken.
inline unsigned char toByte(float scaled) {
    int value = scaled > 0.0f ? static_cast<int>(std::min(scaled, 65536.0f)) : 0;
    if (value > 255) {
        throw std::logic_error("Color value out of range: " + std::to_string(value));
    }
    return static_cast<unsigned char>(value);
}

// Plain text PPM (P3)
inline void writePpmHeader(std::ostream& out, int width, int height) {
    out << "P3\n" << width << " " << height << "\n255\n";
    OUTPUT_CHECK(out, "PPM header");
}

inline void writePpmPixel(std::ostream& out, const unsigned char* rgb) {
    out << static_cast<int>(rgb[0]) << " "
        << static_cast<int>(rgb[1]) << " "
        << static_cast<int>(rgb[2]) << "\n";
    OUTPUT_CHECK(out, "pixel");
}

// data holds width * height RGB triples, top row first
inline void writePpm(std::ostream& out, int width, int height, const std::vector<unsigned char>& data) {
    writePpmHeader(out, width, height);
    for (size_t i = 0; i + 2 < data.size(); i += 3) {
        writePpmPixel(out, &data[i]);
    }
    out.flush();
    OUTPUT_CHECK(out, "PPM data");
}

// PNG through stb_image_write, same pixel layout as writePpm
bool savePng(const std::string& filename, const std::vector<unsigned char>& data, int width, int height);
