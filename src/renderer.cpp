#include "../include/renderer.hpp"
#include "../include/utils/image_utils.hpp"
#include <omp.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

const char* drawingModeName(DrawingMode mode) {
    switch (mode) {
        case DrawingMode::COLORS:  return "colors";
        case DrawingMode::NORMALS: return "normals";
        case DrawingMode::SAMPLES: return "samples";
    }
    return "unknown";
}

Renderer::Renderer(const Settings& settings)
    : settings(settings)
    , camera(static_cast<float>(settings.width) / static_cast<float>(std::max(settings.height, 1))) {
    if (settings.width <= 0 || settings.height <= 0) {
        throw std::invalid_argument("Image size must be positive, got " +
            std::to_string(settings.width) + "x" + std::to_string(settings.height));
    }
    if (settings.mode == DrawingMode::SAMPLES && settings.samplesPerPixel <= 0) {
        throw std::invalid_argument("Samples per pixel must be positive, got " +
            std::to_string(settings.samplesPerPixel));
    }
    if (settings.maxBounces < 0) {
        throw std::invalid_argument("Max bounces must not be negative, got " +
            std::to_string(settings.maxBounces));
    }

    if (settings.showProgress) {
        std::cout << "Renderer initialized with " << settings.width << "x" << settings.height
                  << " resolution" << std::endl;
    }
}

void Renderer::addMesh(Mesh mesh) {
    world.add(std::move(mesh));
}

void Renderer::renderSequential(std::ostream& out) const {
    logStart("sequential");

    std::atomic<int> pixelsCompleted{0};
    std::atomic<int> lastPercentage{0};
    RandomGenerator& rng = RandomGenerator::threadLocal();
    unsigned char rgb[3];

    writePpmHeader(out, settings.width, settings.height);
    for (int y = settings.height - 1; y >= 0; --y) {
        for (int x = 0; x < settings.width; ++x) {
            encodePixel(generatePixel(x, y, rng), rgb);
            writePpmPixel(out, rgb);
            reportProgress(pixelsCompleted, lastPercentage);
        }
    }
    out.flush();
    OUTPUT_CHECK(out, "PPM data");

    if (settings.showProgress) {
        std::cout << "\nRendering completed" << std::endl;
    }
}

void Renderer::renderParallel(std::ostream& out) const {
    std::vector<unsigned char> pixels = renderPixels();
    writePpm(out, settings.width, settings.height, pixels);
}

std::vector<unsigned char> Renderer::renderPixels() const {
    logStart("parallel");

    const int width = settings.width;
    const int height = settings.height;
    std::vector<glm::vec3> frameBuffer(static_cast<size_t>(width) * height, glm::vec3(0.0f));

    std::atomic<int> pixelsCompleted{0};
    std::atomic<int> lastPercentage{0};

    // Row 0 of the frame buffer is the top scanline
    #pragma omp parallel for collapse(2) schedule(dynamic, 1)
    for (int row = 0; row < height; ++row) {
        for (int x = 0; x < width; ++x) {
            RandomGenerator& rng = RandomGenerator::threadLocal();
            int y = height - 1 - row;
            frameBuffer[static_cast<size_t>(row) * width + x] = generatePixel(x, y, rng);
            reportProgress(pixelsCompleted, lastPercentage);
        }
    }

    std::vector<unsigned char> pixels(frameBuffer.size() * 3);
    for (size_t i = 0; i < frameBuffer.size(); ++i) {
        encodePixel(frameBuffer[i], &pixels[i * 3]);
    }

    if (settings.showProgress) {
        std::cout << "\nRendering completed" << std::endl;
    }
    return pixels;
}

glm::vec3 Renderer::generatePixel(int x, int y, RandomGenerator& rng) const {
    switch (settings.mode) {
        case DrawingMode::COLORS: {
            Ray ray = pixelRay(x, y, 0.0f, 0.0f);
            Hit hit = world.hit(ray);
            return hit.isHit() ? hit.material.albedo : background(ray);
        }

        case DrawingMode::NORMALS: {
            Ray ray = pixelRay(x, y, 0.0f, 0.0f);
            Hit hit = world.hit(ray);
            if (!hit.isHit()) {
                return background(ray);
            }
            return (hit.normal + glm::vec3(1.0f)) * 0.5f;
        }

        case DrawingMode::SAMPLES: {
            glm::vec3 color(0.0f);
            for (int s = 0; s < settings.samplesPerPixel; ++s) {
                color += rayColor(sampleRay(x, y, rng), settings.maxBounces, rng);
            }
            return color;
        }
    }

    return glm::vec3(0.0f);
}

Ray Renderer::pixelRay(int x, int y, float jitterX, float jitterY) const {
    // A single column or row maps to the left or bottom edge
    float u = (static_cast<float>(x) + jitterX) / static_cast<float>(std::max(settings.width - 1, 1));
    float v = (static_cast<float>(y) + jitterY) / static_cast<float>(std::max(settings.height - 1, 1));
    return camera.getRay(u, v);
}

glm::vec3 Renderer::rayColor(const Ray& ray, int depth, RandomGenerator& rng) const {
    if (depth <= 0) {
        return glm::vec3(0.0f);
    }

    Hit hit = world.hit(ray);
    if (!hit.isHit()) {
        return background(ray);
    }

    glm::vec3 attenuation;
    Ray scattered;
    if (!hit.material.scatter(ray, hit, rng, attenuation, scattered)) {
        return glm::vec3(0.0f);
    }

    return attenuation * rayColor(scattered, depth - 1, rng);
}

void Renderer::encodePixel(const glm::vec3& color, unsigned char* rgb) const {
    if (settings.mode == DrawingMode::SAMPLES) {
        // Average, then gamma 2
        float scale = 1.0f / static_cast<float>(settings.samplesPerPixel);
        for (int c = 0; c < 3; ++c) {
            float value = std::sqrt(color[c] * scale);
            rgb[c] = toByte(glm::clamp(value, 0.0f, 0.999f) * 255.0f);
        }
    } else {
        for (int c = 0; c < 3; ++c) {
            rgb[c] = toByte(color[c] * 255.0f);
        }
    }
}

void Renderer::logStart(const char* path) const {
    if (!settings.showProgress) {
        return;
    }

    std::cout << "\nStarting " << path << " render with settings:" << std::endl;
    std::cout << "Resolution: " << settings.width << "x" << settings.height << std::endl;
    std::cout << "Mode: " << drawingModeName(settings.mode) << std::endl;
    if (settings.mode == DrawingMode::SAMPLES) {
        std::cout << "Samples per pixel: " << settings.samplesPerPixel << std::endl;
        std::cout << "Max bounces: " << settings.maxBounces << std::endl;
    }
    std::cout << "Meshes: " << world.getMeshes().size()
              << " (" << world.triangleCount() << " triangles)" << std::endl;
    if (std::string(path) == "parallel") {
        std::cout << "Threads: " << omp_get_max_threads() << std::endl;
    }
}

void Renderer::reportProgress(std::atomic<int>& pixelsCompleted, std::atomic<int>& lastPercentage) const {
    if (!settings.showProgress) {
        return;
    }

    int totalPixels = settings.width * settings.height;
    int completed = ++pixelsCompleted;
    int percentage = static_cast<int>((static_cast<long long>(completed) * 100) / totalPixels);

    int oldPercentage = lastPercentage.load();
    if (percentage > oldPercentage &&
        lastPercentage.compare_exchange_strong(oldPercentage, percentage)) {
        #pragma omp critical
        {
            std::cout << "\rRendering progress: " << percentage << "% ("
                      << completed << "/" << totalPixels << " pixels)" << std::flush;
        }
    }
}
