#ifndef CORE_BOUNDS_H_
#define CORE_BOUNDS_H_

#include "config/surface_config.hpp"
#include "core/math.hpp"

namespace lensgen {

/**
 * @brief Field-of-view region, as an ellipse on the reference plane y = seed_distance.
 *
 * A point is projected along its ray from the observer onto the reference plane. The ellipse semi-axes are
 * d * tan(h_fov / 2) and d * tan(v_fov / 2), so the ellipse is exactly the cross section of the viewing cone.
 */
class FovBounds {
 public:
  explicit FovBounds(const SurfaceConfig& config);

  /**
   * @brief Check whether a point is inside the field of view. Points behind the observer are never inside.
   * @throw LensError ErrorKind::kDegenerateProjection if the point has zero depth along the observer axis.
   */
  bool Contains(const Vec3d& pt) const;

  // Projection of a point onto the reference plane.
  Vec3d Project(const Vec3d& pt) const;

  double h_radius() const;
  double v_radius() const;

 private:
  double distance_;
  double h_radius_;
  double v_radius_;
};

}  // namespace lensgen

#endif  // CORE_BOUNDS_H_
