#include "file_mesh.hpp"
#include <spdlog/spdlog.h>

namespace thickadv {

template <class DeviceView>
static void get_from_file(const std::string &name,
                          const netCDF::NcFile &mesh_file, DeviceView view) {
  auto var = mesh_file.getVar(name);
  if (var.isNull()) {
    throw std::runtime_error("Mesh file is missing variable " + name);
  }
  auto host_view = create_mirror_view(HostMemSpace(), view);
  var.getVar(host_view.data());
  deep_copy(view, host_view);
}

static Int get_dim(const std::string &name, const netCDF::NcFile &mesh_file) {
  auto dim = mesh_file.getDim(name);
  if (dim.isNull()) {
    throw std::runtime_error("Mesh file is missing dimension " + name);
  }
  return dim.getSize();
}

FileMesh::FileMesh(const std::string &filename, Int nvertlevels)
    : FileMesh(netCDF::NcFile(filename, netCDF::NcFile::read), nvertlevels) {}

FileMesh::FileMesh(const netCDF::NcFile &mesh_file, Int nvertlevels)
    : MPASMesh(get_dim("nCells", mesh_file), get_dim("nEdges", mesh_file),
               nvertlevels, get_dim("maxEdges", mesh_file)) {

  get_from_file("nEdgesOnCell", mesh_file, m_nedges_on_cell);
  get_from_file("edgesOnCell", mesh_file, m_edges_on_cell);

  get_from_file("areaCell", mesh_file, m_area_cell);
  get_from_file("xCell", mesh_file, m_x_cell);
  get_from_file("yCell", mesh_file, m_y_cell);

  get_from_file("cellsOnEdge", mesh_file, m_cells_on_edge);

  get_from_file("dcEdge", mesh_file, m_dc_edge);
  get_from_file("dvEdge", mesh_file, m_dv_edge);
  get_from_file("angleEdge", mesh_file, m_angle_edge);
  get_from_file("xEdge", mesh_file, m_x_edge);
  get_from_file("yEdge", mesh_file, m_y_edge);

  // bottom topography is optional, without it every column is full depth
  if (!mesh_file.getVar("maxLevelCell").isNull()) {
    get_from_file("maxLevelCell", mesh_file, m_max_level_cell);
    clamp_max_level_cell();
  }

  spdlog::info("Read mesh with {} cells, {} edges, {} vertical levels",
               m_ncells, m_nedges, m_nvertlevels);

  convert_fortran_indices_to_cxx();
  finalize_mesh();
}

// Columns deeper than the requested number of levels are cut at the bottom.
void FileMesh::clamp_max_level_cell() const {
  Int nclamped;
  thickadv_parallel_reduce(
      "count_deep_cells", {m_ncells},
      KOKKOS_CLASS_LAMBDA(Int icell, Int & accum) {
        if (m_max_level_cell(icell) > m_nvertlevels) {
          accum += 1;
        }
      },
      nclamped);

  if (nclamped > 0) {
    spdlog::warn("maxLevelCell exceeds {} vertical levels in {} cells, "
                 "clamping",
                 m_nvertlevels, nclamped);
    thickadv_parallel_for(
        "clamp_max_level_cell", {m_ncells}, KOKKOS_CLASS_LAMBDA(Int icell) {
          if (m_max_level_cell(icell) > m_nvertlevels) {
            m_max_level_cell(icell) = m_nvertlevels;
          }
        });
  }
}

void FileMesh::convert_fortran_indices_to_cxx() const {
  thickadv_parallel_for(
      "fix_cell_indices", {m_ncells}, KOKKOS_CLASS_LAMBDA(Int icell) {
        for (Int j = 0; j < m_max_edges; ++j) {
          m_edges_on_cell(icell, j) -= 1;
        }
      });

  thickadv_parallel_for(
      "fix_edge_indices", {m_nedges}, KOKKOS_CLASS_LAMBDA(Int iedge) {
        for (Int j = 0; j < 2; ++j) {
          m_cells_on_edge(iedge, j) -= 1;
        }
      });
}

void FileMesh::rescale_radius(Real radius) const {
  Real radius2 = radius * radius;
  thickadv_parallel_for(
      "rescale_cell", {m_ncells}, KOKKOS_CLASS_LAMBDA(Int icell) {
        m_x_cell(icell) *= radius;
        m_y_cell(icell) *= radius;
        m_area_cell(icell) *= radius2;
      });

  thickadv_parallel_for(
      "rescale_edge", {m_nedges}, KOKKOS_CLASS_LAMBDA(Int iedge) {
        m_x_edge(iedge) *= radius;
        m_y_edge(iedge) *= radius;
        m_dc_edge(iedge) *= radius;
        m_dv_edge(iedge) *= radius;
      });
}

} // namespace thickadv
