#pragma once

#include "mpas_mesh.hpp"
#include <common.hpp>
#include <netcdf>
#include <string>

namespace thickadv {

struct FileMesh : MPASMesh {

  FileMesh(const std::string &filename, Int nvertlevels = 1);
  FileMesh(const netCDF::NcFile &mesh_file, Int nvertlevels);

  void clamp_max_level_cell() const;
  void convert_fortran_indices_to_cxx() const;
  void rescale_radius(Real radius) const;
};

} // namespace thickadv
