#include "core/bounds.hpp"

#include <cmath>

#include "core/core_def.hpp"
#include "core/error.hpp"

namespace lensgen {

FovBounds::FovBounds(const SurfaceConfig& config)
    : distance_(config.seed_distance_),
      h_radius_(config.seed_distance_ * std::tan(config.fov_.horizontal_ / 2.0 * math::kDegreeToRad)),
      v_radius_(config.seed_distance_ * std::tan(config.fov_.vertical_ / 2.0 * math::kDegreeToRad)) {}


Vec3d FovBounds::Project(const Vec3d& pt) const {
  auto depth = pt.val()[kObserverAxisIdx];
  if (FloatEqualZero(depth)) {
    throw LensError(ErrorKind::kDegenerateProjection, "point has zero depth along observer axis");
  }
  return pt * (distance_ / depth);
}


bool FovBounds::Contains(const Vec3d& pt) const {
  auto proj = Project(pt);
  if (pt.val()[kObserverAxisIdx] < 0.0) {
    return false;
  }
  auto u = proj.x() / h_radius_;
  auto v = proj.z() / v_radius_;
  return u * u + v * v <= 1.0;
}


double FovBounds::h_radius() const {
  return h_radius_;
}


double FovBounds::v_radius() const {
  return v_radius_;
}

}  // namespace lensgen
