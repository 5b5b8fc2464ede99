#pragma once

#include <glm/glm.hpp>

struct Ray;
struct Hit;
class RandomGenerator;

enum class MaterialType {
    DIFFUSE,
    METAL
};

struct Material {
    MaterialType type = MaterialType::DIFFUSE;
    glm::vec3 albedo = glm::vec3(1.0f);
    float fuzz = 0.0f;  // Metal only, 0 is a perfect mirror

    static Material diffuse(const glm::vec3& albedo) {
        Material material;
        material.type = MaterialType::DIFFUSE;
        material.albedo = albedo;
        return material;
    }

    static Material metal(const glm::vec3& albedo, float fuzz) {
        Material material;
        material.type = MaterialType::METAL;
        material.albedo = albedo;
        material.fuzz = glm::clamp(fuzz, 0.0f, 1.0f);
        return material;
    }

    // Returns false when the ray is absorbed. On success fills in the color
    // multiplier for this bounce and the outgoing ray.
    bool scatter(const Ray& incoming, const Hit& hit, RandomGenerator& rng,
                 glm::vec3& attenuation, Ray& scattered) const;
};

namespace MaterialUtils {
    // Lift scattered rays off the surface so they cannot re-hit it
    const float SURFACE_OFFSET = 0.001f;

    inline glm::vec3 reflect(const glm::vec3& v, const glm::vec3& n) {
        return v - 2.0f * glm::dot(v, n) * n;
    }
}
