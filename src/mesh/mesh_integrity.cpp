#include "mesh_integrity.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace thickadv {

namespace {

constexpr std::size_t max_reported_problems = 20;

template <class DeviceView> auto to_host(const DeviceView &view) {
  auto host_view = create_mirror_view(HostMemSpace(), view);
  deep_copy(host_view, view);
  return host_view;
}

struct ProblemList {
  std::vector<std::string> m_problems;

  void add(std::string problem) {
    m_problems.push_back(std::move(problem));
    if (m_problems.size() <= max_reported_problems) {
      spdlog::error("Mesh integrity: {}", m_problems.back());
    }
  }
};

} // namespace

void check_mesh_integrity(const MPASMesh &mesh) {
  const auto nedges_on_cell = to_host(mesh.m_nedges_on_cell);
  const auto edges_on_cell = to_host(mesh.m_edges_on_cell);
  const auto edge_sign_on_cell = to_host(mesh.m_edge_sign_on_cell);
  const auto area_cell = to_host(mesh.m_area_cell);
  const auto dv_edge = to_host(mesh.m_dv_edge);
  const auto max_level_edge_bot = to_host(mesh.m_max_level_edge_bot);

  ProblemList problems;

  std::vector<Int> cell_count(mesh.m_nedges, 0);
  std::vector<Real> sign_sum(mesh.m_nedges, 0);

  for (Int icell = 0; icell < mesh.m_ncells; ++icell) {
    if (!(area_cell(icell) > 0)) {
      problems.add(fmt::format("cell {} has non-positive area {}", icell,
                               area_cell(icell)));
    }

    const Int nedges = nedges_on_cell(icell);
    if (nedges < 0 || nedges > mesh.m_max_edges) {
      problems.add(
          fmt::format("cell {} has {} edges, expected between 0 and {}", icell,
                      nedges, mesh.m_max_edges));
      continue;
    }

    for (Int j = 0; j < nedges; ++j) {
      const Int jedge = edges_on_cell(icell, j);
      if (jedge < 0 || jedge >= mesh.m_nedges) {
        problems.add(
            fmt::format("cell {} refers to edge {} out of range [0, {})",
                        icell, jedge, mesh.m_nedges));
        continue;
      }

      const Real sign = edge_sign_on_cell(icell, j);
      if (sign != 1 && sign != -1) {
        problems.add(fmt::format("cell {} has sign {} on edge {}", icell,
                                 sign, jedge));
      }

      cell_count[jedge] += 1;
      sign_sum[jedge] += sign;
    }
  }

  for (Int iedge = 0; iedge < mesh.m_nedges; ++iedge) {
    if (!(dv_edge(iedge) > 0)) {
      problems.add(fmt::format("edge {} has non-positive length {}", iedge,
                               dv_edge(iedge)));
    }

    const Int nlevels = max_level_edge_bot(iedge);
    if (nlevels < 0 || nlevels > mesh.m_nvertlevels) {
      problems.add(fmt::format(
          "edge {} has {} active levels, expected between 0 and {}", iedge,
          nlevels, mesh.m_nvertlevels));
    }

    if (cell_count[iedge] > 2) {
      problems.add(fmt::format("edge {} is shared by {} cells", iedge,
                               cell_count[iedge]));
    } else if (cell_count[iedge] == 2 && sign_sum[iedge] != 0) {
      problems.add(fmt::format(
          "edge {} has the same sign in both of its cells", iedge));
    }
  }

  const Int nproblems = problems.m_problems.size();
  if (nproblems > 0) {
    std::string what = problems.m_problems.front();
    if (nproblems > 1) {
      what += fmt::format(" (and {} more problems)", nproblems - 1);
    }
    throw MeshIntegrityError(what, nproblems);
  }

  spdlog::debug("Mesh integrity: {} cells and {} edges passed", mesh.m_ncells,
                mesh.m_nedges);
}

} // namespace thickadv
