#include "thickness_hadv_cell.hpp"
#include <spdlog/spdlog.h>

namespace thickadv {

ThicknessHorzAdvOnCell::ThicknessHorzAdvOnCell(const MPASMesh *mesh)
    : m_nedges_on_cell(mesh->m_nedges_on_cell),
      m_edges_on_cell(mesh->m_edges_on_cell),
      m_edge_sign_on_cell(mesh->m_edge_sign_on_cell),
      m_max_level_edge_bot(mesh->m_max_level_edge_bot),
      m_dv_edge(mesh->m_dv_edge), m_area_cell(mesh->m_area_cell) {}

void ThicknessHorzAdvOnCell::configure(bool disable_thick_hadv) {
  m_enabled = !disable_thick_hadv;
  spdlog::debug("Thickness horizontal advection {}",
                m_enabled ? "enabled" : "disabled");
}

} // namespace thickadv
