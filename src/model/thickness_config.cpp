#include "thickness_config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace thickadv {

static void read_option(const YAML::Node &section, const std::string &key,
                        bool &value) {
  const auto node = section[key];
  if (!node) {
    return;
  }
  try {
    value = node.as<bool>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Config option " + key +
                             " is not a boolean: " + e.what());
  }
}

ThicknessParams read_thickness_params(const YAML::Node &config) {
  ThicknessParams params;

  if (config.IsNull()) {
    return params;
  }
  if (!config.IsMap()) {
    throw std::runtime_error("Config document is not a map");
  }

  const auto section = config["thickness_hadv"];
  if (section && !section.IsNull()) {
    if (!section.IsMap()) {
      throw std::runtime_error("Config section thickness_hadv is not a map");
    }
    read_option(section, "config_disable_thick_hadv",
                params.m_disable_thick_hadv);
    read_option(section, "config_check_mesh_integrity",
                params.m_check_mesh_integrity);
  }

  spdlog::info("config_disable_thick_hadv = {}", params.m_disable_thick_hadv);
  spdlog::info("config_check_mesh_integrity = {}",
               params.m_check_mesh_integrity);

  return params;
}

ThicknessParams read_thickness_params(const std::string &filename) {
  YAML::Node config;
  try {
    config = YAML::LoadFile(filename);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Cannot read config file " + filename + ": " +
                             e.what());
  }
  spdlog::info("Reading thickness advection options from {}", filename);
  return read_thickness_params(config);
}

} // namespace thickadv
