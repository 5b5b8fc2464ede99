#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include "../include/mesh.hpp"
#include "../include/renderer.hpp"
#include "../include/utils/image_utils.hpp"

// Usage: mesh_tracer_demo [output.ppm] [models_dir] [--png]
int main(int argc, char** argv) {
    try {
        std::string outputPath = "output.ppm";
        std::string modelsDir = "models";
        bool writePng = false;

        int positional = 0;
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--png") == 0) {
                writePng = true;
            } else if (positional == 0) {
                outputPath = argv[i];
                positional++;
            } else if (positional == 1) {
                modelsDir = argv[i];
                positional++;
            } else {
                std::cerr << "Usage: " << argv[0] << " [output.ppm] [models_dir] [--png]" << std::endl;
                return 1;
            }
        }

        Renderer::Settings settings;
        settings.width = 1000;
        settings.height = 1000;
        settings.mode = DrawingMode::SAMPLES;
        settings.samplesPerPixel = 5;

        Renderer renderer(settings);

        std::cout << "Setting up scene..." << std::endl;

        // Floor
        Mesh floor;
        if (!floor.loadFromObj(modelsDir + "/plane.obj", false)) {
            throw std::runtime_error("Failed to load plane mesh");
        }
        floor.scale(4.0f);
        floor.rotate(glm::vec3(0.0f, 0.0f, 0.0f));
        floor.translate(glm::vec3(0.0f, -1.4f, -10.0f));
        floor.material = Material::metal(glm::vec3(0.89f, 0.4f, 0.4f), 0.0f);

        // Cube
        Mesh cube;
        if (!cube.loadFromObj(modelsDir + "/cube.obj", false)) {
            throw std::runtime_error("Failed to load cube mesh");
        }
        cube.scale(1.0f);
        cube.rotate(glm::vec3(0.0f, 10.0f, 0.0f));
        cube.translate(glm::vec3(0.0f, -0.4f, -12.0f));
        cube.material = Material::diffuse(glm::vec3(0.8f, 0.8f, 0.4f));

        renderer.addMesh(floor);
        renderer.addMesh(cube);

        std::vector<unsigned char> pixels = renderer.renderPixels();

        std::ofstream outputFile(outputPath);
        if (!outputFile) {
            throw std::runtime_error("Failed to create PPM file: " + outputPath);
        }
        writePpm(outputFile, settings.width, settings.height, pixels);
        std::cout << "Image saved as: " << outputPath << std::endl;

        if (writePng) {
            std::string pngPath = outputPath;
            size_t dot = pngPath.rfind('.');
            if (dot != std::string::npos) {
                pngPath.erase(dot);
            }
            pngPath += ".png";
            if (!savePng(pngPath, pixels, settings.width, settings.height)) {
                return 1;
            }
        }

        std::cout << "Render completed successfully!" << std::endl;
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
