#pragma once

#include <glm/glm.hpp>
#include "ray.hpp"
#include "hit.hpp"

struct Triangle {
    glm::vec3 points[3];         // Vertices
    glm::vec3 normal;            // Face normal
    glm::vec3 normals[3];        // Vertex normals, used when smooth
    bool smooth;

    Triangle(const glm::vec3& p0, const glm::vec3& p1, const glm::vec3& p2,
             const glm::vec3& faceNormal)
        : points{p0, p1, p2}
        , normal(faceNormal)
        , normals{faceNormal, faceNormal, faceNormal}
        , smooth(false) {}

    Triangle(const glm::vec3& p0, const glm::vec3& p1, const glm::vec3& p2,
             const glm::vec3& n0, const glm::vec3& n1, const glm::vec3& n2)
        : points{p0, p1, p2}
        , normal(glm::normalize(glm::cross(p1 - p0, p2 - p0)))
        , normals{n0, n1, n2}
        , smooth(true) {}

    // Möller–Trumbore. Material is left for the owning mesh to fill in.
    Hit hit(const Ray& ray) const {
        const float EPSILON = 0.0000001f;
        Hit result;

        // Compute edges
        glm::vec3 edge1 = points[1] - points[0];
        glm::vec3 edge2 = points[2] - points[0];

        // Calculate determinant
        glm::vec3 h = glm::cross(ray.direction, edge2);
        float a = glm::dot(edge1, h);

        // Check if ray is parallel to triangle
        if (a > -EPSILON && a < EPSILON)
            return result;

        float f = 1.0f / a;
        glm::vec3 s = ray.origin - points[0];
        float u = f * glm::dot(s, h);

        // Check if intersection lies outside triangle
        if (u < 0.0f || u > 1.0f)
            return result;

        glm::vec3 q = glm::cross(s, edge1);
        float v = f * glm::dot(ray.direction, q);

        if (v < 0.0f || u + v > 1.0f)
            return result;

        float t = f * glm::dot(edge2, q);

        // Reject intersections at or behind the ray origin
        if (t <= EPSILON)
            return result;

        result.t = t;
        result.at = ray.at(t);
        result.triangle = this;
        result.u = u;
        result.v = v;
        result.normal = shadingNormal(u, v);
        return result;
    }

    glm::vec3 shadingNormal(float u, float v) const {
        if (!smooth) {
            return normal;
        }
        float w = 1.0f - u - v;
        return glm::normalize(w * normals[0] + u * normals[1] + v * normals[2]);
    }
};
