#pragma once

#include <common.hpp>

namespace thickadv {

struct ThicknessParams {
  bool m_disable_thick_hadv = false;
  bool m_check_mesh_integrity = true;
};
} // namespace thickadv
