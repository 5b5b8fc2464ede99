#include "test_common.hpp"
#include "../include/camera.hpp"
#include "../include/mesh.hpp"
#include "../include/ray.hpp"
#include "../include/world.hpp"

// Camera-facing square at depth z made of two triangles
static Mesh square(float z, float halfSize, const Material& material) {
    glm::vec3 n(0.0f, 0.0f, 1.0f);
    Mesh mesh;
    mesh.add(Triangle(glm::vec3(-halfSize, -halfSize, z), glm::vec3(halfSize, -halfSize, z),
                      glm::vec3(halfSize, halfSize, z), n));
    mesh.add(Triangle(glm::vec3(-halfSize, -halfSize, z), glm::vec3(halfSize, halfSize, z),
                      glm::vec3(-halfSize, halfSize, z), n));
    mesh.material = material;
    return mesh;
}

int test_empty_world() {
    std::cout << "Testing empty world...\n";

    World world;
    Hit hit = world.hit(Ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f)));
    TEST_ASSERT(!hit.isHit(), "no meshes, no hit");
    TEST_ASSERT(hit.t <= 0.0f, "miss sentinel");
    TEST_ASSERT(hit.triangle == nullptr, "no triangle on a miss");
    TEST_ASSERT(world.triangleCount() == 0, "no triangles");

    Mesh empty;
    world.add(empty);
    TEST_ASSERT(!world.hit(Ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f))).isHit(), "empty mesh, no hit");

    std::cout << "  Empty: PASS\n";
    return 0;
}

int test_mesh_hit() {
    std::cout << "Testing mesh hit...\n";

    Material red = Material::diffuse(glm::vec3(1.0f, 0.0f, 0.0f));
    Mesh mesh = square(-5.0f, 1.0f, red);

    Hit hit = mesh.hit(Ray(glm::vec3(0.2f, 0.3f, 0.0f), glm::vec3(0.0f, 0.0f, -1.0f)));
    TEST_ASSERT(hit.isHit(), "ray through the square hits");
    TEST_ASSERT(near(hit.t, 5.0f), "distance to the square");
    TEST_ASSERT(near(hit.material.albedo, red.albedo), "mesh material is stamped on the hit");
    TEST_ASSERT(hit.triangle == &mesh.triangles[0] || hit.triangle == &mesh.triangles[1], "hit refers to a mesh triangle");

    Hit miss = mesh.hit(Ray(glm::vec3(3.0f, 0.0f, 0.0f), glm::vec3(0.0f, 0.0f, -1.0f)));
    TEST_ASSERT(!miss.isHit(), "ray beside the square misses");

    std::cout << "  Mesh: PASS\n";
    return 0;
}

int test_closest_mesh() {
    std::cout << "Testing closest mesh...\n";

    Material nearMaterial = Material::diffuse(glm::vec3(0.1f, 0.2f, 0.3f));
    Material farMaterial = Material::metal(glm::vec3(0.9f, 0.8f, 0.7f), 0.0f);

    // Insertion order does not matter
    for (int order = 0; order < 2; ++order) {
        World world;
        if (order == 0) {
            world.add(square(-5.0f, 1.0f, nearMaterial));
            world.add(square(-8.0f, 3.0f, farMaterial));
        } else {
            world.add(square(-8.0f, 3.0f, farMaterial));
            world.add(square(-5.0f, 1.0f, nearMaterial));
        }

        Hit hit = world.hit(Ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f)));
        TEST_ASSERT(hit.isHit(), "ray hits the stack");
        TEST_ASSERT(near(hit.at.z, -5.0f), "nearest square wins");
        TEST_ASSERT(hit.material.type == MaterialType::DIFFUSE, "winner's material is kept");
        TEST_ASSERT(near(hit.material.albedo, nearMaterial.albedo), "winner's albedo is kept");

        // Only the far square is wide enough here
        Hit edge = world.hit(Ray(glm::vec3(0.0f), glm::vec3(0.3f, 0.0f, -1.0f)));
        TEST_ASSERT(edge.isHit() && near(edge.at.z, -8.0f), "far square visible past the near one");
        TEST_ASSERT(edge.material.type == MaterialType::METAL, "far material is stamped");
    }

    std::cout << "  Closest: PASS\n";
    return 0;
}

int test_z_ordering() {
    std::cout << "Testing z based ordering...\n";

    // Looking down +z, the larger z is farther along the ray but still wins.
    World world;
    world.add(square(2.0f, 1.0f, Material::diffuse(glm::vec3(0.2f))));
    world.add(square(5.0f, 1.0f, Material::diffuse(glm::vec3(0.6f))));

    Hit hit = world.hit(Ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 1.0f)));
    TEST_ASSERT(hit.isHit(), "ray hits");
    TEST_ASSERT(near(hit.at.z, 5.0f), "larger z wins");
    TEST_ASSERT(near(hit.t, 5.0f), "even though it is farther");

    std::cout << "  Z ordering: PASS\n";
    return 0;
}

int test_mesh_z_ordering() {
    std::cout << "Testing z based ordering inside one mesh...\n";

    Mesh mesh = square(2.0f, 1.0f, Material::diffuse(glm::vec3(0.2f)));
    Mesh farther = square(5.0f, 1.0f, Material::diffuse(glm::vec3(0.2f)));
    mesh.add(farther.triangles[0]);
    mesh.add(farther.triangles[1]);
    TEST_ASSERT(mesh.triangles.size() == 4, "both squares in one mesh");

    Ray ray(glm::vec3(0.1f, -0.2f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f));
    Hit hit = mesh.hit(ray);
    TEST_ASSERT(hit.isHit(), "ray hits");
    TEST_ASSERT(near(hit.at.z, 5.0f), "larger z wins within the mesh");
    TEST_ASSERT(near(hit.t, 5.0f), "even though it is farther");
    TEST_ASSERT(hit.triangle == &mesh.triangles[2] || hit.triangle == &mesh.triangles[3], "hit refers to the z = 5 square");

    std::cout << "  Mesh z ordering: PASS\n";
    return 0;
}

int test_camera() {
    std::cout << "Testing camera...\n";

    Camera camera(2.0f);
    TEST_ASSERT(near(camera.getOrigin(), glm::vec3(0.0f)), "origin");
    TEST_ASSERT(near(camera.getHorizontal(), glm::vec3(4.0f, 0.0f, 0.0f)), "horizontal extent");
    TEST_ASSERT(near(camera.getVertical(), glm::vec3(0.0f, 2.0f, 0.0f)), "vertical extent");
    TEST_ASSERT(near(camera.getLowerLeftCorner(), glm::vec3(-2.0f, -1.0f, -5.0f)), "lower left corner");

    Ray center = camera.getRay(0.5f, 0.5f);
    TEST_ASSERT(near(center.origin, glm::vec3(0.0f)), "rays start at the origin");
    TEST_ASSERT(near(center.direction, glm::vec3(0.0f, 0.0f, -1.0f)), "center ray looks down -z");

    Ray corner = camera.getRay(1.0f, 1.0f);
    TEST_ASSERT(near(corner.direction, glm::normalize(glm::vec3(2.0f, 1.0f, -5.0f))), "upper right corner ray");

    std::cout << "  Camera: PASS\n";
    return 0;
}

int main() {
    std::cout << "=== World Tests ===\n";

    int result = 0;
    result |= test_empty_world();
    result |= test_mesh_hit();
    result |= test_closest_mesh();
    result |= test_z_ordering();
    result |= test_mesh_z_ordering();
    result |= test_camera();

    return reportResult(result);
}
