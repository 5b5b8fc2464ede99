#pragma once

#include <atomic>
#include <ostream>
#include <vector>
#include <glm/glm.hpp>
#include "camera.hpp"
#include "mesh.hpp"
#include "random.hpp"
#include "ray.hpp"
#include "world.hpp"

// What a pixel shows
// * COLORS  - albedo of the surface hit, no bouncing
// * NORMALS - surface normal mapped to [0, 1]
// * SAMPLES - path traced, samplesPerPixel jittered rays per pixel
enum class DrawingMode {
    COLORS,
    NORMALS,
    SAMPLES
};

const char* drawingModeName(DrawingMode mode);

class Renderer {
public:
    struct Settings {
        int width;
        int height;
        DrawingMode mode;
        int samplesPerPixel;
        int maxBounces;
        bool showProgress;

        Settings()
            : width(480)
            , height(270)
            , mode(DrawingMode::SAMPLES)
            , samplesPerPixel(3)
            , maxBounces(5)
            , showProgress(true) {}
    };

    explicit Renderer(const Settings& settings = Settings());

    // Meshes must all be added before the first render call
    void addMesh(Mesh mesh);

    // Computes and writes one pixel at a time
    void renderSequential(std::ostream& out) const;

    // Computes every pixel in parallel, then writes them in scanline order
    void renderParallel(std::ostream& out) const;

    // Encoded RGB triples, top row first, computed in parallel
    std::vector<unsigned char> renderPixels() const;

    // Unencoded color of pixel (x, y), y = 0 being the bottom row. In
    // SAMPLES mode this is the sum over all samples.
    glm::vec3 generatePixel(int x, int y, RandomGenerator& rng) const;

    // Ray through the lower left corner of pixel (x, y) plus a jitter in [0, 1)
    Ray pixelRay(int x, int y, float jitterX, float jitterY) const;

    Ray sampleRay(int x, int y, RandomGenerator& rng) const {
        float jitterX = rng.randomFloat();
        float jitterY = rng.randomFloat();
        return pixelRay(x, y, jitterX, jitterY);
    }

    glm::vec3 rayColor(const Ray& ray, int depth, RandomGenerator& rng) const;

    void encodePixel(const glm::vec3& color, unsigned char* rgb) const;

    static glm::vec3 background(const Ray& ray) {
        glm::vec3 unitDirection = glm::normalize(ray.direction);
        float t = 0.5f * (unitDirection.y + 1.0f);
        return (1.0f - t) * glm::vec3(1.0f) + t * glm::vec3(0.5f, 0.7f, 1.0f);
    }

    const Settings& getSettings() const { return settings; }
    const Camera& getCamera() const { return camera; }
    const World& getWorld() const { return world; }

private:
    Settings settings;
    Camera camera;
    World world;

    void logStart(const char* path) const;
    void reportProgress(std::atomic<int>& pixelsCompleted, std::atomic<int>& lastPercentage) const;
};
