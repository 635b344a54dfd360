#pragma once

#include "thickness_params.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace thickadv {

// Options live under the thickness_hadv section; absent keys keep their
// defaults.
ThicknessParams read_thickness_params(const YAML::Node &config);
ThicknessParams read_thickness_params(const std::string &filename);

} // namespace thickadv
