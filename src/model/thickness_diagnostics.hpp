#pragma once

#include <common.hpp>
#include <mesh/mpas_mesh.hpp>

namespace thickadv {
// Area-weighted sum of the thickness tendency at level k. Vanishes on a
// closed mesh when the tendency holds only flux divergence terms.
Real mass_tendency_integral(const MPASMesh *mesh,
                            const RealConst2d &h_tend_cell, Int k);
} // namespace thickadv
