#include "planar_hexagonal_mesh.hpp"

namespace thickadv {

PlanarHexagonalMesh::PlanarHexagonalMesh(Int nx, Int ny, Int nvertlevels)
    : PlanarHexagonalMesh(nx, ny, 1. / nx, nvertlevels) {}

PlanarHexagonalMesh::PlanarHexagonalMesh(Int nx, Int ny, Real dc,
                                         Int nvertlevels)
    : MPASMesh(nx * ny, 3 * nx * ny, nvertlevels, maxedges), m_nx(nx),
      m_ny(ny), m_dc(dc) {

  m_period_x = nx * dc;
  m_period_y = ny * dc * sqrt(3) / 2;

  compute_mesh_arrays();
}

KOKKOS_INLINE_FUNCTION Int PlanarHexagonalMesh::cellidx(Int icol,
                                                        Int irow) const {
  return irow * m_nx + icol;
}

KOKKOS_INLINE_FUNCTION Int PlanarHexagonalMesh::cell_on_cell(Int icol, Int irow,
                                                             Int nb) const {
  Int mx = icol == 0 ? m_nx - 1 : icol - 1;
  Int px = icol == (m_nx - 1) ? 0 : icol + 1;

  Int my = irow == 0 ? m_ny - 1 : irow - 1;
  Int py = irow == (m_ny - 1) ? 0 : irow + 1;

  if (irow % 2 == 0) {
    switch (nb) {
    case 0:
      return cellidx(mx, irow);
    case 1:
      return cellidx(mx, my);
    case 2:
      return cellidx(icol, my);
    case 3:
      return cellidx(px, irow);
    case 4:
      return cellidx(icol, py);
    case 5:
      return cellidx(mx, py);
    }
  } else {
    switch (nb) {
    case 0:
      return cellidx(mx, irow);
    case 1:
      return cellidx(icol, my);
    case 2:
      return cellidx(px, my);
    case 3:
      return cellidx(px, irow);
    case 4:
      return cellidx(px, py);
    case 5:
      return cellidx(icol, py);
    }
  }
  return -1;
}

// edges 0, 1, 2 are owned by the cell, edges 3, 4, 5 by the neighbours
// across them
KOKKOS_INLINE_FUNCTION Int PlanarHexagonalMesh::edge_on_cell(Int icell,
                                                             Int icol, Int irow,
                                                             Int nb) const {
  if (nb < 3) {
    return 3 * icell + nb;
  }
  if (nb < maxedges) {
    return 3 * cell_on_cell(icol, irow, nb) + nb - 3;
  }
  return -1;
}

void PlanarHexagonalMesh::compute_mesh_arrays() {
  thickadv_parallel_for(
      "compute_mesh_arrays", {m_ny, m_nx},
      KOKKOS_CLASS_LAMBDA(Int irow, Int icol) {
        Int icell = cellidx(icol, irow);
        m_nedges_on_cell(icell) = maxedges;

        for (Int j = 0; j < maxedges; ++j) {
          m_edges_on_cell(icell, j) = edge_on_cell(icell, icol, irow, j);
        }

        for (Int j = 0; j < 3; ++j) {
          m_cells_on_edge(m_edges_on_cell(icell, j), 1) = icell;
        }
        for (Int j = 3; j < maxedges; ++j) {
          m_cells_on_edge(m_edges_on_cell(icell, j), 0) = icell;
        }
      });

  thickadv_parallel_for(
      "compute_cell_arrays", {m_ny, m_nx},
      KOKKOS_CLASS_LAMBDA(Int irow, Int icol) {
        Int icell = cellidx(icol, irow);
        m_area_cell(icell) = m_dc * m_dc * sqrt(3) / 2;

        if (irow % 2 == 0) {
          m_x_cell(icell) = m_dc * icol + m_dc / 2;
        } else {
          m_x_cell(icell) = m_dc * (icol + 1);
        }
        m_y_cell(icell) = m_dc * (irow + 1) * sqrt(3) / 2;

        m_x_edge(m_edges_on_cell(icell, 0)) = m_x_cell(icell) - m_dc / 2;
        m_y_edge(m_edges_on_cell(icell, 0)) = m_y_cell(icell);

        m_x_edge(m_edges_on_cell(icell, 1)) =
            m_x_cell(icell) - m_dc / 2 * cos(pi / 3);
        m_y_edge(m_edges_on_cell(icell, 1)) =
            m_y_cell(icell) - m_dc / 2 * sin(pi / 3);

        m_x_edge(m_edges_on_cell(icell, 2)) =
            m_x_cell(icell) + m_dc / 2 * cos(pi / 3);
        m_y_edge(m_edges_on_cell(icell, 2)) =
            m_y_cell(icell) - m_dc / 2 * sin(pi / 3);

        m_angle_edge(m_edges_on_cell(icell, 0)) = 0;
        m_angle_edge(m_edges_on_cell(icell, 1)) = pi / 3;
        m_angle_edge(m_edges_on_cell(icell, 2)) = 2 * pi / 3;
      });

  thickadv_parallel_for(
      "compute_edge_arrays", {m_nedges}, KOKKOS_CLASS_LAMBDA(Int iedge) {
        m_dc_edge(iedge) = m_dc;
        m_dv_edge(iedge) = m_dc_edge(iedge) * sqrt(3) / 3;
      });

  finalize_mesh();
}
} // namespace thickadv
