#include "mpas_mesh.hpp"

namespace thickadv {

MPASMesh::MPASMesh(Int ncells, Int nedges, Int nvertlevels, Int max_edges) {
  m_max_edges = max_edges;
  m_ncells = ncells;
  m_nedges = nedges;
  m_nvertlevels = nvertlevels;
  m_nlayers = std::ceil(Real(nvertlevels) / vector_length) * vector_length;
  m_nlayers_vec = std::ceil(Real(nvertlevels) / vector_length);

  // cell properties
  m_nedges_on_cell = Int1d("nedges_on_cell", m_ncells);
  m_edges_on_cell = Int2d("edges_on_cell", m_ncells, m_max_edges);
  m_edge_sign_on_cell = Real2d("edge_sign_on_cell", m_ncells, m_max_edges);
  m_max_level_cell = Int1d("max_level_cell", m_ncells);

  m_area_cell = Real1d("area_cell", m_ncells);
  m_x_cell = Real1d("x_cell", m_ncells);
  m_y_cell = Real1d("y_cell", m_ncells);

  // edge properties
  m_cells_on_edge = Int2d("cells_on_edge", m_nedges, 2);
  m_max_level_edge_bot = Int1d("max_level_edge_bot", m_nedges);
  m_max_level_edge_top = Int1d("max_level_edge_top", m_nedges);

  m_dc_edge = Real1d("dc_edge", m_nedges);
  m_dv_edge = Real1d("dv_edge", m_nedges);
  m_angle_edge = Real1d("angle_edge", m_nedges);
  m_x_edge = Real1d("x_edge", m_nedges);
  m_y_edge = Real1d("y_edge", m_nedges);

  deep_copy(m_max_level_cell, m_nvertlevels);
}

void MPASMesh::finalize_mesh() {
  // the normal of an edge points from cells_on_edge(iedge, 0) to
  // cells_on_edge(iedge, 1)
  thickadv_parallel_for(
      "finalize_cell", {m_ncells}, KOKKOS_CLASS_LAMBDA(Int icell) {
        for (Int j = 0; j < m_nedges_on_cell(icell); ++j) {
          m_edge_sign_on_cell(icell, j) =
              m_cells_on_edge(m_edges_on_cell(icell, j), 0) == icell ? -1 : 1;
        }
      });

  thickadv_parallel_for(
      "finalize_edge", {m_nedges}, KOKKOS_CLASS_LAMBDA(Int iedge) {
        const Int jcell0 = m_cells_on_edge(iedge, 0);
        const Int jcell1 = m_cells_on_edge(iedge, 1);

        const Int level0 = jcell0 >= 0 ? m_max_level_cell(jcell0) : 0;
        const Int level1 = jcell1 >= 0 ? m_max_level_cell(jcell1) : 0;

        m_max_level_edge_bot(iedge) = level0 > level1 ? level0 : level1;
        m_max_level_edge_top(iedge) = level0 < level1 ? level0 : level1;
      });
}

} // namespace thickadv
