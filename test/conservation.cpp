#include <iostream>
#include <memory>
#include <thickadv.hpp>

using namespace thickadv;

void init_uniform(const ThicknessState &state) {
  deep_copy(state.m_vn_edge, 1);
  deep_copy(state.m_h_edge, 1);
  deep_copy(state.m_h_tend_cell, 0);
}

void init_smooth(const PlanarHexagonalMesh &mesh,
                 const ThicknessState &state) {
  const Real lx = mesh.m_period_x;
  const Real ly = mesh.m_period_y;

  auto &vn_edge = state.m_vn_edge;
  auto &h_edge = state.m_h_edge;
  THICKADV_SCOPE(x_edge, mesh.m_x_edge);
  THICKADV_SCOPE(y_edge, mesh.m_y_edge);
  THICKADV_SCOPE(angle_edge, mesh.m_angle_edge);
  parallel_for(
      "init_vn_and_h",
      MDRangePolicy<2>({0, 0}, {mesh.m_nedges, mesh.m_nlayers}),
      KOKKOS_LAMBDA(Int iedge, Int k) {
        Real x = x_edge(iedge);
        Real y = y_edge(iedge);
        Real nx = std::cos(angle_edge(iedge));
        Real ny = std::sin(angle_edge(iedge));
        Real vx = 1 + std::sin(2 * pi * x / lx) * std::cos(2 * pi * y / ly);
        Real vy = std::cos(2 * pi * (k + 1) * x / lx);
        vn_edge(iedge, k) = nx * vx + ny * vy;
        h_edge(iedge, k) = 100 + 10 * std::exp(std::cos(2 * pi * y / ly));
      });
  deep_copy(state.m_h_tend_cell, 0);
}

// Each edge flux enters the area-weighted sum twice, once per cell.
Real gross_flux(const MPASMesh *mesh, const ThicknessState &state, Int k) {
  THICKADV_SCOPE(vn_edge, state.m_vn_edge);
  THICKADV_SCOPE(h_edge, state.m_h_edge);
  THICKADV_SCOPE(dv_edge, mesh->m_dv_edge);

  Real total;
  parallel_reduce(
      "compute_gross_flux", RangePolicy(0, mesh->m_nedges),
      KOKKOS_LAMBDA(Int iedge, Real & accum) {
        accum += 2 * std::abs(vn_edge(iedge, k) * dv_edge(iedge) *
                              h_edge(iedge, k));
      },
      total);
  return total;
}

void compute_and_check(const std::string &name,
                       const ThicknessTendency &tendency,
                       const ThicknessState &state) {
  if (tendency.compute_h_tendency(state) != ErrorCode::success) {
    throw std::runtime_error("compute_h_tendency failed (" + name + ")");
  }

  const MPASMesh *mesh = tendency.m_mesh;
  for (Int k = 0; k < mesh->m_nvertlevels; ++k) {
    Real integral = mass_tendency_integral(mesh, state.m_h_tend_cell, k);
    Real scale = gross_flux(mesh, state, k);
    std::cout << name << " level " << k << " " << integral << " " << scale
              << std::endl;
    if (std::abs(integral) > 1e-13 * scale) {
      throw std::runtime_error("Thickness advection is not conservative (" +
                               name + ")");
    }
  }
}

void run() {
  Int nvertlevels = 5;
  auto mesh = std::make_unique<PlanarHexagonalMesh>(16, 16, nvertlevels);

  ThicknessState state(mesh.get());

  {
    ThicknessTendency tendency(mesh.get(), ThicknessParams());
    init_uniform(state);
    compute_and_check("uniform", tendency, state);

    init_smooth(*mesh, state);
    compute_and_check("smooth", tendency, state);
  }

  // variable bottom topography, every edge keeps the deeper of its cells
  THICKADV_SCOPE(max_level_cell, mesh->m_max_level_cell);
  parallel_for(
      "init_topography", RangePolicy(0, mesh->m_ncells),
      KOKKOS_LAMBDA(Int icell) {
        max_level_cell(icell) = 1 + (7 * icell) % nvertlevels;
      });
  mesh->finalize_mesh();

  {
    ThicknessTendency tendency(mesh.get(), ThicknessParams());
    init_smooth(*mesh, state);
    compute_and_check("topography", tendency, state);
  }
}

int main() {
  Kokkos::initialize();
  run();
  Kokkos::finalize();
}
