#pragma once

#include <common.hpp>
#include <error.hpp>
#include <mesh/file_mesh.hpp>
#include <mesh/mesh_integrity.hpp>
#include <mesh/mpas_mesh.hpp>
#include <mesh/planar_hexagonal_mesh.hpp>

#include <model/thickness_config.hpp>
#include <model/thickness_diagnostics.hpp>
#include <model/thickness_params.hpp>
#include <model/thickness_state.hpp>
#include <model/thickness_tendency.hpp>
