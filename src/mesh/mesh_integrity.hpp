#pragma once

#include <common.hpp>
#include <error.hpp>
#include <mesh/mpas_mesh.hpp>

namespace thickadv {

// Validates the geometry and connectivity used by the thickness advection
// kernel. Every problem is logged; the first one is carried by the thrown
// MeshIntegrityError.
void check_mesh_integrity(const MPASMesh &mesh);

} // namespace thickadv
