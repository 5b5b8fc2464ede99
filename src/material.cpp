#include "../include/material.hpp"
#include "../include/hit.hpp"
#include "../include/ray.hpp"
#include "../include/random.hpp"

bool Material::scatter(const Ray& incoming, const Hit& hit, RandomGenerator& rng,
                       glm::vec3& attenuation, Ray& scattered) const {
    const glm::vec3& normal = hit.normal;
    glm::vec3 origin = hit.at + normal * MaterialUtils::SURFACE_OFFSET;

    switch (type) {
        case MaterialType::DIFFUSE: {
            glm::vec3 direction = normal + rng.randomUnitVector();

            // Random vector almost opposite to the normal
            if (glm::dot(direction, direction) < 1e-12f) {
                direction = normal;
            }

            scattered = Ray(origin, direction);
            attenuation = albedo;
            return true;
        }

        case MaterialType::METAL: {
            glm::vec3 reflected = MaterialUtils::reflect(incoming.direction, normal);
            if (fuzz > 0.0f) {
                reflected += fuzz * rng.randomUnitVector();
            }

            if (glm::dot(reflected, normal) <= 0.0f) {
                return false;
            }

            scattered = Ray(origin, reflected);
            attenuation = albedo;
            return true;
        }
    }

    return false;
}
