#pragma once

#include <common.hpp>
#include <mesh/mpas_mesh.hpp>

namespace thickadv {

struct ThicknessState {
  Real2d m_vn_edge;
  Real2d m_h_edge;
  Real2d m_h_tend_cell;

  ThicknessState(const MPASMesh *mesh);
};
} // namespace thickadv
