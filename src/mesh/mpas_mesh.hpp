#pragma once

#include <common.hpp>

namespace thickadv {

struct MPASMesh {
  static constexpr Int default_maxedges = 6;

  Int m_max_edges;
  Int m_nvertlevels;
  Int m_nlayers;
  Int m_nlayers_vec;
  Int m_ncells;
  Int m_nedges;

  Int1d m_nedges_on_cell;
  Int2d m_edges_on_cell;
  Real2d m_edge_sign_on_cell;
  Int1d m_max_level_cell;

  Real1d m_area_cell;
  Real1d m_x_cell;
  Real1d m_y_cell;

  Int2d m_cells_on_edge;

  // levels below max_level_edge_top are wet on both sides of the edge
  Int1d m_max_level_edge_bot;
  Int1d m_max_level_edge_top;

  Real1d m_dc_edge;
  Real1d m_dv_edge;
  Real1d m_angle_edge;
  Real1d m_x_edge;
  Real1d m_y_edge;

  MPASMesh(Int ncells, Int nedges, Int nvertlevels,
           Int max_edges = default_maxedges);

  // Derives edge signs on cells and the active level range of every edge
  // from cells_on_edge and max_level_cell.
  void finalize_mesh();
};

} // namespace thickadv
