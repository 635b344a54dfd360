#include "thickness_tendency.hpp"
#include <mesh/mesh_integrity.hpp>
#include <spdlog/spdlog.h>

namespace thickadv {

template <class V>
static bool has_extents(const V &view, Int n0, Int n1) {
  return view.extent_int(0) >= n0 && view.extent_int(1) >= n1;
}

ThicknessTendency::ThicknessTendency(const MPASMesh *mesh,
                                     const ThicknessParams &params)
    : m_params(params), m_mesh(mesh), m_thickness_hadv_cell(mesh) {

  if (m_params.m_check_mesh_integrity) {
    check_mesh_integrity(*m_mesh);
  }

  m_thickness_hadv_cell.configure(m_params.m_disable_thick_hadv);
}

ErrorCode ThicknessTendency::compute_h_tendency(
    const Real2d &h_tend_cell, const RealConst2d &vn_edge,
    const RealConst2d &h_edge) const {
  THICKADV_SCOPE(thickness_hadv_cell, m_thickness_hadv_cell);

  if (!thickness_hadv_cell.m_enabled) {
    return ErrorCode::success;
  }

  const Int ncells = m_mesh->m_ncells;
  const Int nedges = m_mesh->m_nedges;
  const Int nlayers = m_mesh->m_nlayers;
  const Int nvertlevels = m_mesh->m_nvertlevels;

  // the tendency is loaded and stored in whole chunks, edge fields are only
  // read above max_level_edge_bot
  if (!has_extents(h_tend_cell, ncells, nlayers) ||
      !has_extents(vn_edge, nedges, nvertlevels) ||
      !has_extents(h_edge, nedges, nvertlevels)) {
    spdlog::error("compute_h_tendency: fields must be at least {} x {} on "
                  "cells and {} x {} on edges",
                  ncells, nlayers, nedges, nvertlevels);
    return ErrorCode::field_extent_mismatch;
  }

  timer_start("thickness_hadv");
  thickadv_parallel_for(
      "compute_h_tend", {ncells, m_mesh->m_nlayers_vec},
      KOKKOS_LAMBDA(Int icell, Int kchunk) {
        thickness_hadv_cell(h_tend_cell, icell, kchunk, vn_edge, h_edge);
      });
  timer_stop("thickness_hadv");

  return ErrorCode::success;
}

ErrorCode
ThicknessTendency::compute_h_tendency(const ThicknessState &state) const {
  return compute_h_tendency(state.m_h_tend_cell, state.m_vn_edge,
                            state.m_h_edge);
}

} // namespace thickadv
