#pragma once

#include <glm/glm.hpp>
#include "ray.hpp"

// Pinhole camera at the origin looking down -z
class Camera {
public:
    explicit Camera(float aspectRatio = 16.0f/9.0f) {
        const float viewportHeight = 2.0f;
        const float viewportWidth = aspectRatio * viewportHeight;
        const float focalLength = 5.0f;

        origin = glm::vec3(0.0f);
        horizontal = glm::vec3(viewportWidth, 0.0f, 0.0f);
        vertical = glm::vec3(0.0f, viewportHeight, 0.0f);
        lowerLeftCorner = origin - horizontal/2.0f - vertical/2.0f - glm::vec3(0.0f, 0.0f, focalLength);
    }

    // s and t in [0, 1] across the viewport, (0, 0) is the lower left corner
    Ray getRay(float s, float t) const {
        return Ray(origin, lowerLeftCorner + s*horizontal + t*vertical - origin);
    }

    const glm::vec3& getOrigin() const { return origin; }
    const glm::vec3& getHorizontal() const { return horizontal; }
    const glm::vec3& getVertical() const { return vertical; }
    const glm::vec3& getLowerLeftCorner() const { return lowerLeftCorner; }

private:
    glm::vec3 origin;
    glm::vec3 horizontal;
    glm::vec3 vertical;
    glm::vec3 lowerLeftCorner;
};
