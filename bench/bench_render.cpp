#include <chrono>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "../include/mesh.hpp"
#include "../include/renderer.hpp"

// Compares the sequential and parallel render paths on the demo scene
// Usage: mesh_tracer_bench [models_dir] [iterations]

static Renderer setupScene(const std::string& modelsDir) {
    Renderer::Settings settings;
    settings.showProgress = false;
    Renderer renderer(settings);

    Mesh floor;
    if (!floor.loadFromObj(modelsDir + "/plane.obj", false)) {
        throw std::runtime_error("Failed to load plane mesh");
    }
    floor.scale(4.0f);
    floor.translate(glm::vec3(0.0f, -1.4f, -10.0f));
    floor.material = Material::metal(glm::vec3(0.89f, 0.4f, 0.4f), 0.0f);

    Mesh cube;
    if (!cube.loadFromObj(modelsDir + "/cube.obj", false)) {
        throw std::runtime_error("Failed to load cube mesh");
    }
    cube.rotate(glm::vec3(0.0f, 10.0f, 0.0f));
    cube.translate(glm::vec3(0.0f, -0.4f, -12.0f));
    cube.material = Material::diffuse(glm::vec3(0.8f, 0.8f, 0.4f));

    renderer.addMesh(floor);
    renderer.addMesh(cube);
    return renderer;
}

template <typename RenderFn>
static double averageMilliseconds(int iterations, RenderFn render) {
    double total = 0.0;
    for (int i = 0; i < iterations; ++i) {
        std::ostringstream output;
        auto start = std::chrono::steady_clock::now();
        render(output);
        auto end = std::chrono::steady_clock::now();
        total += std::chrono::duration<double, std::milli>(end - start).count();
    }
    return total / iterations;
}

int main(int argc, char** argv) {
    try {
        std::string modelsDir = argc > 1 ? argv[1] : "models";
        int iterations = argc > 2 ? std::stoi(argv[2]) : 5;
        if (iterations <= 0) {
            std::cerr << "Iterations must be positive" << std::endl;
            return 1;
        }

        Renderer renderer = setupScene(modelsDir);

        double sequential = averageMilliseconds(iterations, [&](std::ostream& out) {
            renderer.renderSequential(out);
        });
        double parallel = averageMilliseconds(iterations, [&](std::ostream& out) {
            renderer.renderParallel(out);
        });

        std::cout << "sequential: " << sequential << " ms" << std::endl;
        std::cout << "parallel:   " << parallel << " ms" << std::endl;
        std::cout << "speedup:    " << sequential / parallel << "x" << std::endl;
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
