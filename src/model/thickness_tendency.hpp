#pragma once

#include "tendency_terms/thickness_hadv_cell.hpp"
#include "thickness_params.hpp"
#include "thickness_state.hpp"
#include <common.hpp>
#include <error.hpp>
#include <mesh/mpas_mesh.hpp>

namespace thickadv {

struct ThicknessTendency {
  ThicknessParams m_params;

  const MPASMesh *m_mesh;

  ThicknessHorzAdvOnCell m_thickness_hadv_cell;

  // Adds the horizontal advection term to h_tend_cell. The tendency is never
  // reset here; other terms may already have contributed to it.
  ErrorCode compute_h_tendency(const Real2d &h_tend_cell,
                               const RealConst2d &vn_edge,
                               const RealConst2d &h_edge) const;

  ErrorCode compute_h_tendency(const ThicknessState &state) const;

  // Throws MeshIntegrityError if m_check_mesh_integrity is set and the mesh
  // fails validation.
  ThicknessTendency(const MPASMesh *mesh, const ThicknessParams &params);
};

} // namespace thickadv
