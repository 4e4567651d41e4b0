#include "export/glb_exporter.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <limits>

#define TINYGLTF_IMPLEMENTATION
#define TINYGLTF_NO_INCLUDE_JSON
#define TINYGLTF_NO_STB_IMAGE
#define TINYGLTF_NO_STB_IMAGE_WRITE
#define TINYGLTF_NO_EXTERNAL_IMAGE
#include <tiny_gltf.h>

namespace cityfuse::exporter {

namespace {

void append_bytes(std::vector<unsigned char>& buffer, const void* data, size_t size) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    buffer.insert(buffer.end(), bytes, bytes + size);
}

tinygltf::Model to_model(const mesh::Mesh& mesh) {
    tinygltf::Model model;
    model.asset.version = "2.0";
    model.asset.generator = "cityfuse";

    tinygltf::Buffer buffer;

    // Positions, Y-up
    std::vector<float> positions;
    positions.reserve(mesh.vertices.size() * 3);
    std::vector<double> min_values(3, std::numeric_limits<double>::max());
    std::vector<double> max_values(3, std::numeric_limits<double>::lowest());
    for (const auto& v : mesh.vertices) {
        const float p[3] = {static_cast<float>(v.x), static_cast<float>(v.z), static_cast<float>(-v.y)};
        for (int i = 0; i < 3; ++i) {
            positions.push_back(p[i]);
            min_values[i] = std::min(min_values[i], static_cast<double>(p[i]));
            max_values[i] = std::max(max_values[i], static_cast<double>(p[i]));
        }
    }
    append_bytes(buffer.data, positions.data(), positions.size() * sizeof(float));

    tinygltf::BufferView bf_positions;
    bf_positions.buffer = 0;
    bf_positions.byteOffset = 0;
    bf_positions.byteLength = positions.size() * sizeof(float);
    bf_positions.target = TINYGLTF_TARGET_ARRAY_BUFFER;
    model.bufferViews.push_back(bf_positions);

    tinygltf::Accessor acc_positions;
    acc_positions.bufferView = 0;
    acc_positions.componentType = TINYGLTF_COMPONENT_TYPE_FLOAT;
    acc_positions.type = TINYGLTF_TYPE_VEC3;
    acc_positions.count = mesh.vertices.size();
    acc_positions.minValues = min_values;
    acc_positions.maxValues = max_values;
    model.accessors.push_back(acc_positions);

    // Indices, one view for every range
    const size_t index_offset = buffer.data.size();
    append_bytes(buffer.data, mesh.indices.data(), mesh.indices.size() * sizeof(uint32_t));

    tinygltf::BufferView bf_indices;
    bf_indices.buffer = 0;
    bf_indices.byteOffset = index_offset;
    bf_indices.byteLength = mesh.indices.size() * sizeof(uint32_t);
    bf_indices.target = TINYGLTF_TARGET_ELEMENT_ARRAY_BUFFER;
    model.bufferViews.push_back(bf_indices);

    tinygltf::Mesh gltf_mesh;
    gltf_mesh.name = mesh.identifier;

    for (const auto& range : mesh.ranges) {
        tinygltf::Material material;
        material.name = range.material.name;
        material.pbrMetallicRoughness.baseColorFactor = {
            range.material.color.r, range.material.color.g,
            range.material.color.b, range.material.color.a};
        material.pbrMetallicRoughness.metallicFactor = 0.0;
        material.pbrMetallicRoughness.roughnessFactor = 0.9;
        model.materials.push_back(material);

        uint32_t lo = std::numeric_limits<uint32_t>::max();
        uint32_t hi = 0;
        const size_t first = static_cast<size_t>(range.first_face) * 3;
        const size_t count = static_cast<size_t>(range.face_count) * 3;
        for (size_t i = first; i < first + count; ++i) {
            lo = std::min(lo, mesh.indices[i]);
            hi = std::max(hi, mesh.indices[i]);
        }

        tinygltf::Accessor acc_indices;
        acc_indices.bufferView = 1;
        acc_indices.byteOffset = first * sizeof(uint32_t);
        acc_indices.componentType = TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT;
        acc_indices.type = TINYGLTF_TYPE_SCALAR;
        acc_indices.count = count;
        acc_indices.minValues = {static_cast<double>(lo)};
        acc_indices.maxValues = {static_cast<double>(hi)};

        tinygltf::Primitive primitive;
        primitive.attributes["POSITION"] = 0;
        primitive.indices = static_cast<int>(model.accessors.size());
        primitive.material = static_cast<int>(model.materials.size() - 1);
        primitive.mode = TINYGLTF_MODE_TRIANGLES;
        model.accessors.push_back(acc_indices);
        gltf_mesh.primitives.push_back(primitive);
    }

    model.buffers.push_back(buffer);
    model.meshes.push_back(gltf_mesh);

    tinygltf::Node node;
    node.mesh = 0;
    node.name = mesh.identifier;
    model.nodes.push_back(node);

    tinygltf::Value::Object extras;
    extras["osm_id"] = tinygltf::Value(mesh.identifier);
    extras["epsg"] = tinygltf::Value(mesh.epsg);
    extras["origin"] = tinygltf::Value(tinygltf::Value::Array{
        tinygltf::Value(mesh.origin.x), tinygltf::Value(mesh.origin.y), tinygltf::Value(mesh.origin.z)});

    tinygltf::Scene scene;
    scene.name = mesh.identifier;
    scene.nodes.push_back(0);
    scene.extras = tinygltf::Value(extras);
    model.scenes.push_back(scene);
    model.defaultScene = 0;

    return model;
}

} // namespace

void GlbExporter::export_mesh(const mesh::Mesh& mesh, const std::filesystem::path& destination) {
    if (!mesh.is_valid()) {
        throw PipelineError(FailureKind::WriteError, mesh.identifier + ": refusing to write an empty mesh");
    }

    tinygltf::Model model = to_model(mesh);

    const std::filesystem::path temporary = core::temporary_path_for(destination);
    tinygltf::TinyGLTF gltf;
    const bool written = gltf.WriteGltfSceneToFile(&model, temporary.string(),
                                                   true,    // embedImages
                                                   true,    // embedBuffers
                                                   false,   // prettyPrint
                                                   true);   // writeBinary
    std::error_code ec;
    if (!written || !std::filesystem::exists(temporary, ec) || std::filesystem::file_size(temporary, ec) == 0) {
        std::filesystem::remove(temporary, ec);
        throw PipelineError(FailureKind::WriteError, "cannot write " + destination.string());
    }

    core::commit_file(temporary, destination);

    spdlog::debug("GlbExporter: Wrote {} ({} vertices, {} faces, {} materials)",
                  destination.filename().string(), mesh.vertices.size(), mesh.face_count(),
                  mesh.ranges.size());
}

} // namespace cityfuse::exporter
