#pragma once

#include <limits>
#include <glm/glm.hpp>
#include "material.hpp"

struct Triangle;

// Result of an intersection query. t <= 0 means nothing was hit.
struct Hit {
    float t = -1.0f;
    // Starts at the far end of -z so any real hit point wins the z comparison
    glm::vec3 at = glm::vec3(0.0f, 0.0f, -std::numeric_limits<float>::infinity());
    glm::vec3 normal = glm::vec3(0.0f);              // Shading normal at the hit point
    const Triangle* triangle = nullptr;              // Owned by the mesh that was hit
    float u = 0.0f;                                  // Barycentric weight of points[1]
    float v = 0.0f;                                  // Barycentric weight of points[2]
    Material material;

    Hit() = default;

    bool isHit() const {
        return t > 0.0f;
    }
};
