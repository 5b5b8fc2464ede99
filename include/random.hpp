#pragma once

#include <cmath>
#include <random>
#include <glm/glm.hpp>

// Uniform random source for sampling. Each thread owns its own instance
// through threadLocal(); instances are never shared between threads.
class RandomGenerator {
public:
    explicit RandomGenerator(unsigned int seed = std::random_device{}())
        : rng(seed)
        , distribution(0.0f, 1.0f) {}

    virtual ~RandomGenerator() = default;

    // Uniform in [0, 1)
    virtual float randomFloat() {
        return distribution(rng);
    }

    glm::vec3 randomInUnitSphere() {
        while (true) {
            glm::vec3 p = 2.0f * glm::vec3(
                randomFloat(),
                randomFloat(),
                randomFloat()
            ) - glm::vec3(1.0f);

            if (glm::dot(p, p) < 1.0f)
                return p;
        }
    }

    glm::vec3 randomUnitVector() {
        while (true) {
            glm::vec3 p = randomInUnitSphere();
            float lengthSquared = glm::dot(p, p);
            if (lengthSquared > 1e-12f)
                return p / std::sqrt(lengthSquared);
        }
    }

    static RandomGenerator& threadLocal() {
        thread_local RandomGenerator generator;
        return generator;
    }

private:
    std::mt19937 rng;
    std::uniform_real_distribution<float> distribution;
};
