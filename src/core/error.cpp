#include "core/error.hpp"

namespace lensgen {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kDegenerateInput:
      return "DegenerateInput";
    case ErrorKind::kDegenerateProjection:
      return "DegenerateProjection";
    case ErrorKind::kDegenerateTangent:
      return "DegenerateTangent";
    case ErrorKind::kInvalidConfiguration:
      return "InvalidConfiguration";
    case ErrorKind::kMarchLimit:
      return "MarchLimit";
    case ErrorKind::kIo:
      return "Io";
  }
  return "Unknown";
}


LensError::LensError(ErrorKind kind, const std::string& what)
    : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + what), kind_(kind) {}


ErrorKind LensError::kind() const noexcept {
  return kind_;
}

}  // namespace lensgen
