#include "thickness_diagnostics.hpp"

namespace thickadv {

Real mass_tendency_integral(const MPASMesh *mesh,
                            const RealConst2d &h_tend_cell, Int k) {
  THICKADV_SCOPE(area_cell, mesh->m_area_cell);

  Real total;
  thickadv_parallel_reduce(
      "compute_mass_tendency", {mesh->m_ncells},
      KOKKOS_LAMBDA(Int icell, Real & accum) {
        accum += area_cell(icell) * h_tend_cell(icell, k);
      },
      total);
  return total;
}

} // namespace thickadv
