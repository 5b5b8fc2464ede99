#pragma once

#include <cmath>
#include <iostream>
#include <string>
#include <glm/glm.hpp>

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " (line " << __LINE__ << ")\n"; \
            return 1; \
        } \
    } while(0)

constexpr float EPSILON = 1e-5f;

inline bool near(float a, float b, float eps = EPSILON) {
    return std::abs(a - b) < eps;
}

inline bool near(const glm::vec3& a, const glm::vec3& b, float eps = EPSILON) {
    return near(a.x, b.x, eps) && near(a.y, b.y, eps) && near(a.z, b.z, eps);
}

#ifndef MESH_TRACER_TEST_OUTPUT_DIR
#define MESH_TRACER_TEST_OUTPUT_DIR "."
#endif

// Where tests write their temporary files
inline std::string outputPath(const std::string& name) {
    return std::string(MESH_TRACER_TEST_OUTPUT_DIR) + "/" + name;
}

inline int reportResult(int result) {
    std::cout << "\n";
    if (result == 0) {
        std::cout << "=== ALL TESTS PASSED ===\n";
    } else {
        std::cout << "=== SOME TESTS FAILED ===\n";
    }
    return result;
}
