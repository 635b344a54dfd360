#include <iostream>
#include <memory>
#include <thickadv.hpp>

using namespace thickadv;

void init_fields(const PlanarHexagonalMesh &mesh,
                 const ThicknessState &state) {
  const Real lx = mesh.m_period_x;

  auto &vn_edge = state.m_vn_edge;
  auto &h_edge = state.m_h_edge;
  THICKADV_SCOPE(x_edge, mesh.m_x_edge);
  THICKADV_SCOPE(angle_edge, mesh.m_angle_edge);
  parallel_for(
      "init_vn_and_h",
      MDRangePolicy<2>({0, 0}, {mesh.m_nedges, mesh.m_nlayers}),
      KOKKOS_LAMBDA(Int iedge, Int k) {
        Real x = x_edge(iedge);
        vn_edge(iedge, k) = std::cos(angle_edge(iedge)) + 0.1 * k;
        h_edge(iedge, k) = 1 + 0.5 * std::sin(2 * pi * x / lx);
      });

  auto &h_tend_cell = state.m_h_tend_cell;
  parallel_for(
      "init_h_tend",
      MDRangePolicy<2>({0, 0}, {mesh.m_ncells, mesh.m_nlayers}),
      KOKKOS_LAMBDA(Int icell, Int k) { h_tend_cell(icell, k) = 0.5 * k; });
}

// Overwrites vn on the given edge from level kstart downwards.
void set_vn(const ThicknessState &state, Int iedge, Int kstart, Real value) {
  auto vn_edge = create_mirror_view(HostMemSpace(), state.m_vn_edge);
  deep_copy(vn_edge, state.m_vn_edge);
  for (Int k = kstart; k < vn_edge.extent_int(1); ++k) {
    vn_edge(iedge, k) = value;
  }
  deep_copy(state.m_vn_edge, vn_edge);
}

void set_max_level_edge_bot(const MPASMesh &mesh, Int iedge, Int nlevels) {
  auto max_level_edge_bot =
      create_mirror_view(HostMemSpace(), mesh.m_max_level_edge_bot);
  deep_copy(max_level_edge_bot, mesh.m_max_level_edge_bot);
  max_level_edge_bot(iedge) = nlevels;
  deep_copy(mesh.m_max_level_edge_bot, max_level_edge_bot);
}

Int count_different(const Real2d &a, const Real2d &b) {
  Int ndiff;
  parallel_reduce(
      "count_different",
      MDRangePolicy<2>({0, 0}, {a.extent_int(0), a.extent_int(1)}),
      KOKKOS_LAMBDA(Int i, Int k, Int & accum) {
        if (a(i, k) != b(i, k)) {
          accum += 1;
        }
      },
      ndiff);
  return ndiff;
}

void compute(const ThicknessTendency &tendency, const ThicknessState &state) {
  if (tendency.compute_h_tendency(state) != ErrorCode::success) {
    throw std::runtime_error("compute_h_tendency failed");
  }
}

// An edge with no active levels contributes nothing, however large its
// velocity. The reference zeroes the velocity on a full-depth edge instead.
void check_dry_edges(Int nvertlevels) {
  auto mesh = std::make_unique<PlanarHexagonalMesh>(6, 6, nvertlevels);
  auto ref_mesh = std::make_unique<PlanarHexagonalMesh>(6, 6, nvertlevels);
  const Int dry_edges[] = {0, 5, 17, 46};

  ThicknessState state(mesh.get());
  ThicknessState ref_state(ref_mesh.get());
  init_fields(*mesh, state);
  init_fields(*ref_mesh, ref_state);

  for (Int iedge : dry_edges) {
    set_max_level_edge_bot(*mesh, iedge, 0);
    set_vn(state, iedge, 0, 1e12);
    set_vn(ref_state, iedge, 0, 0);
  }

  compute(ThicknessTendency(mesh.get(), ThicknessParams()), state);
  compute(ThicknessTendency(ref_mesh.get(), ThicknessParams()), ref_state);

  if (count_different(state.m_h_tend_cell, ref_state.m_h_tend_cell) != 0) {
    throw std::runtime_error("Edge without active levels contributed flux");
  }
}

// A partially active edge contributes only above its bottom level, also
// when that bottom falls inside a vector chunk.
void check_partial_edge(Int nvertlevels, Int bottom) {
  auto mesh = std::make_unique<PlanarHexagonalMesh>(6, 6, nvertlevels);
  auto ref_mesh = std::make_unique<PlanarHexagonalMesh>(6, 6, nvertlevels);
  const Int iedge = 20;

  ThicknessState state(mesh.get());
  ThicknessState ref_state(ref_mesh.get());
  init_fields(*mesh, state);
  init_fields(*ref_mesh, ref_state);

  set_max_level_edge_bot(*mesh, iedge, bottom);
  set_vn(state, iedge, bottom, -3e9);
  set_vn(ref_state, iedge, bottom, 0);

  compute(ThicknessTendency(mesh.get(), ThicknessParams()), state);
  compute(ThicknessTendency(ref_mesh.get(), ThicknessParams()), ref_state);

  if (count_different(state.m_h_tend_cell, ref_state.m_h_tend_cell) != 0) {
    throw std::runtime_error("Levels below the edge bottom received flux");
  }

  // the levels above the edge bottom still carry flux
  if (bottom > 0) {
    init_fields(*ref_mesh, ref_state);
    set_vn(ref_state, iedge, 0, 0);
    compute(ThicknessTendency(ref_mesh.get(), ThicknessParams()), ref_state);
    if (count_different(state.m_h_tend_cell, ref_state.m_h_tend_cell) == 0) {
      throw std::runtime_error("Active levels of a partial edge were skipped");
    }
  }
}

// Edges take the deeper of their two cells as bottom and the shallower as
// top.
void check_edge_levels_from_cells() {
  Int nvertlevels = 4;
  auto mesh = std::make_unique<PlanarHexagonalMesh>(4, 4, nvertlevels);

  THICKADV_SCOPE(max_level_cell, mesh->m_max_level_cell);
  parallel_for(
      "init_topography", RangePolicy(0, mesh->m_ncells),
      KOKKOS_LAMBDA(Int icell) {
        max_level_cell(icell) = 1 + icell % nvertlevels;
      });
  mesh->finalize_mesh();

  auto cells_on_edge =
      create_mirror_view(HostMemSpace(), mesh->m_cells_on_edge);
  auto level_cell = create_mirror_view(HostMemSpace(), mesh->m_max_level_cell);
  auto level_bot =
      create_mirror_view(HostMemSpace(), mesh->m_max_level_edge_bot);
  auto level_top =
      create_mirror_view(HostMemSpace(), mesh->m_max_level_edge_top);
  deep_copy(cells_on_edge, mesh->m_cells_on_edge);
  deep_copy(level_cell, mesh->m_max_level_cell);
  deep_copy(level_bot, mesh->m_max_level_edge_bot);
  deep_copy(level_top, mesh->m_max_level_edge_top);

  for (Int iedge = 0; iedge < mesh->m_nedges; ++iedge) {
    Int level0 = level_cell(cells_on_edge(iedge, 0));
    Int level1 = level_cell(cells_on_edge(iedge, 1));
    if (level_bot(iedge) != std::max(level0, level1) ||
        level_top(iedge) != std::min(level0, level1)) {
      throw std::runtime_error("Wrong edge level range derived from cells");
    }
  }
}

int main() {
  Kokkos::initialize();

  check_edge_levels_from_cells();

  for (Int nvertlevels : {1, 4, 7}) {
    check_dry_edges(nvertlevels);
    for (Int bottom = 0; bottom <= nvertlevels; ++bottom) {
      check_partial_edge(nvertlevels, bottom);
    }
  }
  std::cout << "Edge vertical bounds respected" << std::endl;

  Kokkos::finalize();
}
