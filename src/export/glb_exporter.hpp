/**
 * @file glb_exporter.hpp
 * @brief Binary glTF (GLB) export of building meshes
 *
 * One GLB per mesh: a single node holding one primitive per material,
 * all primitives sharing one POSITION accessor. glTF is Y-up, so the
 * projected (x, y, z) becomes (x, z, -y). The projected origin and EPSG
 * code travel in the scene extras.
 */

#pragma once

#include "mesh/mesh.hpp"
#include <filesystem>

namespace cityfuse::exporter {

class GlbExporter {
public:
    GlbExporter() = default;

    /**
     * @brief Write a mesh as a self-contained .glb
     *
     * The file appears at destination only once it is complete.
     *
     * @throws PipelineError (WriteError) on I/O failure or an empty mesh
     */
    static void export_mesh(const mesh::Mesh& mesh, const std::filesystem::path& destination);
};

} // namespace cityfuse::exporter
