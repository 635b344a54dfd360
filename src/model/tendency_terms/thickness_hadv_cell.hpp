#pragma once

#include <common.hpp>
#include <mesh/mpas_mesh.hpp>

namespace thickadv {

// Horizontal advection of layer thickness. Adds, for every cell and level,
// the signed mass flux through the cell edges divided by the cell area.
// Levels at or below max_level_edge_bot of an edge get nothing from it.
struct ThicknessHorzAdvOnCell {
  bool m_enabled = false;

  Int1d m_nedges_on_cell;
  Int2d m_edges_on_cell;
  Real2d m_edge_sign_on_cell;
  Int1d m_max_level_edge_bot;
  Real1d m_dv_edge;
  Real1d m_area_cell;

  void configure(bool disable_thick_hadv);

#ifdef THICKADV_KOKKOS_SIMD
  KOKKOS_FUNCTION void operator()(const Real2d &h_tend_cell, Int icell,
                                  Int kchunk, const RealConst2d &vn_edge,
                                  const RealConst2d &h_edge) const {
    const Int kstart = kchunk * vector_length;
    const Real inv_area_cell = 1._fp / m_area_cell(icell);

    Vec h_tend_icell;
    h_tend_icell.copy_from(&h_tend_cell(icell, kstart), VecTag());

    for (Int j = 0; j < m_nedges_on_cell(icell); ++j) {
      const Int jedge = m_edges_on_cell(icell, j);
      const Int kmax = m_max_level_edge_bot(jedge);
      if (kstart >= kmax) {
        continue;
      }
      const Real sign = m_edge_sign_on_cell(icell, j);
      const Real dv_jedge = m_dv_edge(jedge);

      if (kstart + vector_length <= kmax) {
        Vec vn_jedge;
        vn_jedge.copy_from(&vn_edge(jedge, kstart), VecTag());

        Vec h_jedge;
        h_jedge.copy_from(&h_edge(jedge, kstart), VecTag());

        const Vec flux = dv_jedge * vn_jedge * h_jedge;
        h_tend_icell += inv_area_cell * (sign * flux);
      } else {
        // the edge bottom falls inside this chunk
        Real h_tend[vector_length];
        h_tend_icell.copy_to(h_tend, VecTag());
        for (Int k = kstart; k < kmax; ++k) {
          const Real flux = vn_edge(jedge, k) * dv_jedge * h_edge(jedge, k);
          h_tend[k - kstart] += sign * flux * inv_area_cell;
        }
        h_tend_icell.copy_from(h_tend, VecTag());
      }
    }

    h_tend_icell.copy_to(&h_tend_cell(icell, kstart), VecTag());
  }
#else
  KOKKOS_FUNCTION void operator()(const Real2d &h_tend_cell, Int icell,
                                  Int kchunk, const RealConst2d &vn_edge,
                                  const RealConst2d &h_edge) const {
    const Int kstart = kchunk * vector_length;
    const Real inv_area_cell = 1._fp / m_area_cell(icell);

    Real h_tend[vector_length];
    THICKADV_SIMD_PRAGMA
    for (Int kvec = 0; kvec < vector_length; ++kvec) {
      h_tend[kvec] = h_tend_cell(icell, kstart + kvec);
    }

    for (Int j = 0; j < m_nedges_on_cell(icell); ++j) {
      const Int jedge = m_edges_on_cell(icell, j);
      const Int kmax = m_max_level_edge_bot(jedge);
      const Real sign = m_edge_sign_on_cell(icell, j);
      const Real dv_jedge = m_dv_edge(jedge);

      THICKADV_SIMD_PRAGMA
      for (Int kvec = 0; kvec < vector_length; ++kvec) {
        const Int k = kstart + kvec;
        if (k < kmax) {
          const Real flux = vn_edge(jedge, k) * dv_jedge * h_edge(jedge, k);
          h_tend[kvec] += sign * flux * inv_area_cell;
        }
      }
    }

    THICKADV_SIMD_PRAGMA
    for (Int kvec = 0; kvec < vector_length; ++kvec) {
      h_tend_cell(icell, kstart + kvec) = h_tend[kvec];
    }
  }
#endif

  ThicknessHorzAdvOnCell(const MPASMesh *mesh);
};

} // namespace thickadv
