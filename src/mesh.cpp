#include "../include/mesh.hpp"
#include <tiny_obj_loader.h>
#include <glm/gtc/matrix_transform.hpp>
#include <iostream>
#include <utility>

bool Mesh::loadFromObj(const std::string& objPath, bool smooth) {
    std::cout << "Loading model from: " << objPath << std::endl;

    tinyobj::ObjReader reader;
    tinyobj::ObjReaderConfig config;
    config.triangulate = true;

    if (!reader.ParseFromFile(objPath, config)) {
        if (!reader.Error().empty()) {
            std::cerr << "TinyObjReader error: " << reader.Error();
        }
        return false;
    }

    if (!reader.Warning().empty()) {
        std::cout << "TinyObjReader warning: " << reader.Warning();
    }

    auto& attrib = reader.GetAttrib();
    auto& shapes = reader.GetShapes();

    std::vector<Triangle> loaded;
    for (const auto& shape : shapes) {
        size_t index_offset = 0;
        for (size_t f = 0; f < shape.mesh.num_face_vertices.size(); f++) {
            size_t fv = shape.mesh.num_face_vertices[f];
            if (fv != 3) {
                std::cout << "Warning: Skipping non-triangular face" << std::endl;
                index_offset += fv;
                continue;
            }

            glm::vec3 vertices[3];
            glm::vec3 normals[3];
            bool hasNormals = true;

            for (size_t v = 0; v < 3; v++) {
                tinyobj::index_t idx = shape.mesh.indices[index_offset + v];

                vertices[v] = glm::vec3(
                    attrib.vertices[3 * idx.vertex_index + 0],
                    attrib.vertices[3 * idx.vertex_index + 1],
                    attrib.vertices[3 * idx.vertex_index + 2]
                );

                if (idx.normal_index >= 0) {
                    normals[v] = glm::vec3(
                        attrib.normals[3 * idx.normal_index + 0],
                        attrib.normals[3 * idx.normal_index + 1],
                        attrib.normals[3 * idx.normal_index + 2]
                    );
                } else {
                    hasNormals = false;
                }
            }

            // Calculate face normal if not provided
            if (!hasNormals) {
                glm::vec3 edge1 = vertices[1] - vertices[0];
                glm::vec3 edge2 = vertices[2] - vertices[0];
                normals[0] = normals[1] = normals[2] = glm::normalize(glm::cross(edge1, edge2));
            }

            Triangle trig(vertices[0], vertices[1], vertices[2], normals[0]);
            if (smooth) {
                trig.smooth = true;
                trig.normals[0] = normals[0];
                trig.normals[1] = normals[1];
                trig.normals[2] = normals[2];
            }
            loaded.push_back(trig);

            index_offset += fv;
        }
    }

    std::cout << "Model loaded successfully:" << std::endl;
    std::cout << "- Vertices: " << attrib.vertices.size() / 3 << std::endl;
    std::cout << "- Normals: " << attrib.normals.size() / 3 << std::endl;
    std::cout << "- Total triangles: " << loaded.size() << std::endl;

    triangles = std::move(loaded);
    material = Material::diffuse(glm::vec3(0.5f));
    return true;
}

void Mesh::translate(const glm::vec3& d) {
    for (auto& trig : triangles) {
        for (auto& point : trig.points) {
            point += d;
        }
    }
}

void Mesh::scale(float c) {
    for (auto& trig : triangles) {
        for (auto& point : trig.points) {
            point *= c;
        }
    }
}

void Mesh::rotate(const glm::vec3& degrees) {
    // Rz * Ry * Rx, so x is applied first
    glm::mat4 transform(1.0f);
    transform = glm::rotate(transform, glm::radians(degrees.z), glm::vec3(0.0f, 0.0f, 1.0f));
    transform = glm::rotate(transform, glm::radians(degrees.y), glm::vec3(0.0f, 1.0f, 0.0f));
    transform = glm::rotate(transform, glm::radians(degrees.x), glm::vec3(1.0f, 0.0f, 0.0f));
    glm::mat3 rotation(transform);

    for (auto& trig : triangles) {
        trig.normal = glm::normalize(rotation * trig.normal);
        for (auto& n : trig.normals) {
            n = glm::normalize(rotation * n);
        }
        for (auto& point : trig.points) {
            point = rotation * point;
        }
    }
}
