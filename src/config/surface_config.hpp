#ifndef CONFIG_SURFACE_CONFIG_H_
#define CONFIG_SURFACE_CONFIG_H_

#include <cstddef>
#include <istream>

#include "core/core_def.hpp"
#include "core/math.hpp"
#include "nlohmann/json.hpp"

namespace lensgen {

struct FovParam {
  double horizontal_;  // Full angle, in degree.
  double vertical_;    // Full angle, in degree.
};

struct StepParam {
  double horizontal_;  // Segment length along a slice, in mm.
  double vertical_;    // Distance between slices, in mm.
};

// =============== Surface configuration ===============
// Observer point (center of the eye) is always the origin. All lengths are in mm.
struct SurfaceConfig {
  FovParam fov_;
  StepParam step_;
  double seed_distance_;   // From observer to the surface, along +y.
  Vec3d source_;           // Point source position.
  size_t max_march_steps_;  // Per marching direction.
};

/**
 * @brief Default values. They describe a 90 x 90 degree lens 50 mm in front of the eye, with the source
 *        beside the right temple.
 */
SurfaceConfig MakeDefaultConfig();

/**
 * @brief Check every field and throw LensError (ErrorKind::kInvalidConfiguration) on the first bad one.
 */
void ValidateConfig(const SurfaceConfig& config);

// Point on the observer axis at seed distance.
Vec3d SeedPoint(const SurfaceConfig& config);

/**
 * @brief Parse a JSON document from a stream and validate it.
 *
 * Missing keys take default values (see MakeDefaultConfig()). Malformed JSON and type mismatches are reported as
 * ErrorKind::kInvalidConfiguration.
 */
SurfaceConfig LoadConfig(std::istream& is);

// convert to/from json object
void to_json(nlohmann::json& j, const Vec3d& v);
void to_json(nlohmann::json& j, const SurfaceConfig& c);
void from_json(const nlohmann::json& j, SurfaceConfig& c);

}  // namespace lensgen

#endif  // CONFIG_SURFACE_CONFIG_H_
