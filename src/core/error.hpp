#ifndef CORE_ERROR_H_
#define CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace lensgen {

enum class ErrorKind {
  kDegenerateInput,       // Zero-length vector where a direction is required.
  kDegenerateProjection,  // Point cannot be projected onto the reference plane.
  kDegenerateTangent,     // Normal is parallel to the crossing axis.
  kInvalidConfiguration,
  kMarchLimit,  // Too many steps in one marching direction.
  kIo,
};

const char* ErrorKindName(ErrorKind kind);


/**
 * @brief Error raised by surface generation.
 *
 * All kinds are fatal for the procedure that raises them. A failed surface build never yields a partial mesh.
 */
class LensError : public std::runtime_error {
 public:
  LensError(ErrorKind kind, const std::string& what);

  ErrorKind kind() const noexcept;

 private:
  ErrorKind kind_;
};

}  // namespace lensgen

#endif  // CORE_ERROR_H_
