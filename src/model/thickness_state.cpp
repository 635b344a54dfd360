#include "thickness_state.hpp"

namespace thickadv {

ThicknessState::ThicknessState(const MPASMesh *mesh)
    : m_vn_edge("vn_edge", mesh->m_nedges, mesh->m_nlayers),
      m_h_edge("h_edge", mesh->m_nedges, mesh->m_nlayers),
      m_h_tend_cell("h_tend_cell", mesh->m_ncells, mesh->m_nlayers) {}

} // namespace thickadv
