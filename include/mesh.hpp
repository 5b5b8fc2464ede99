#pragma once

#include <string>
#include <utility>
#include <vector>
#include <glm/glm.hpp>
#include "ray.hpp"
#include "hit.hpp"
#include "material.hpp"
#include "triangle.hpp"

class Mesh {
public:
    std::vector<Triangle> triangles;
    Material material;

    // Empty mesh with a white diffuse material
    Mesh()
        : material(Material::diffuse(glm::vec3(1.0f))) {}

    explicit Mesh(std::vector<Triangle> trigs)
        : triangles(std::move(trigs))
        , material(Material::diffuse(glm::vec3(0.5f))) {}

    void add(const Triangle& trig) {
        triangles.push_back(trig);
    }

    // Replaces the triangles with the faces of an OBJ file and resets the
    // material to grey diffuse. With smooth set, per-vertex normals are kept
    // for interpolated shading.
    bool loadFromObj(const std::string& objPath, bool smooth);

    void translate(const glm::vec3& d);
    void scale(float c);
    // Angles in degrees, applied about x, then y, then z
    void rotate(const glm::vec3& degrees);

    // Closest hit by the z-coordinate of the hit point (larger z wins).
    // Scenes are laid out along -z in front of the camera, so this picks the
    // surface nearest the viewer only when no surfaces overlap steeply in depth.
    Hit hit(const Ray& ray) const {
        Hit closest;
        for (const auto& trig : triangles) {
            Hit candidate = trig.hit(ray);
            if (candidate.isHit() && candidate.at.z > closest.at.z) {
                closest = candidate;
                closest.material = material;
            }
        }
        return closest;
    }
};
