#pragma once

#include <utility>
#include <vector>
#include "ray.hpp"
#include "hit.hpp"
#include "mesh.hpp"

// All meshes of one render. Read-only once rendering starts.
class World {
public:
    World() = default;

    void add(Mesh mesh) {
        meshes.push_back(std::move(mesh));
    }

    // Same z rule as Mesh::hit, applied across meshes
    Hit hit(const Ray& ray) const {
        Hit closest;
        for (const auto& mesh : meshes) {
            Hit candidate = mesh.hit(ray);
            if (candidate.isHit() && candidate.at.z > closest.at.z) {
                closest = candidate;
            }
        }
        return closest;
    }

    const std::vector<Mesh>& getMeshes() const {
        return meshes;
    }

    size_t triangleCount() const {
        size_t count = 0;
        for (const auto& mesh : meshes) {
            count += mesh.triangles.size();
        }
        return count;
    }

private:
    std::vector<Mesh> meshes;
};
