#include "../include/utils/image_utils.hpp"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#include <iostream>

bool savePng(const std::string& filename, const std::vector<unsigned char>& data, int width, int height) {
    if (data.size() != static_cast<size_t>(width) * height * 3) {
        std::cerr << "PNG export: pixel buffer does not match " << width << "x" << height << std::endl;
        return false;
    }

    if (!stbi_write_png(filename.c_str(), width, height, 3, data.data(), width * 3)) {
        std::cerr << "PNG export failed: " << filename << std::endl;
        return false;
    }

    std::cout << "Image saved as: " << filename << std::endl;
    return true;
}
