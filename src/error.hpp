#pragma once

#include <stdexcept>
#include <string>

namespace thickadv {

enum class ErrorCode { success, field_extent_mismatch, mesh_integrity };

inline const char *to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::success:
    return "success";
  case ErrorCode::field_extent_mismatch:
    return "field extent mismatch";
  case ErrorCode::mesh_integrity:
    return "mesh integrity";
  }
  return "unknown";
}

// Raised by the mesh validation pass, never by the tendency kernel.
struct MeshIntegrityError : std::runtime_error {
  int m_nproblems;

  MeshIntegrityError(const std::string &what, int nproblems)
      : std::runtime_error(what), m_nproblems(nproblems) {}

  ErrorCode code() const { return ErrorCode::mesh_integrity; }
};

} // namespace thickadv
