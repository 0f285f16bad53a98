#ifndef CORE_OPTICS_H_
#define CORE_OPTICS_H_

#include "core/core_def.hpp"
#include "core/math.hpp"

namespace lensgen {

/**
 * @brief Local surface normal that reflects light from the source into the observer point (origin).
 *
 * It is the sum of the unit vector from the point toward the observer and the unit vector from the point toward
 * the source, i.e. the bisector of the two rays. A mirror element with this normal satisfies the law of
 * reflection for the ray source -> point -> observer. The result is not renormalized, and points to the side
 * where observer and source are.
 *
 * @param pt surface point, must differ from both the observer and the source.
 * @param source the point source.
 * @return bisector normal.
 * @throw LensError ErrorKind::kDegenerateInput if pt coincides with the observer or the source, or lies on the
 *        segment between them.
 */
Vec3d ReflectionNormal(const Vec3d& pt, const Vec3d& source);

/**
 * @brief Step vector tangent to the surface, in the marching plane of given axis.
 *
 * For MarchAxis::kHorizontal the step is normal x (+z), thus perpendicular to both normal and the vertical axis.
 * For MarchAxis::kVertical it is normal x (+x). The step is scaled to step_len and always has a non-negative
 * component along the marching axis (+x or +z). Negate it to march in the opposite direction.
 *
 * @throw LensError ErrorKind::kDegenerateTangent if normal is parallel to the crossing axis,
 *        ErrorKind::kInvalidConfiguration if step_len is not positive.
 */
Vec3d TangentStep(const Vec3d& normal, MarchAxis axis, double step_len);

// Unit vector of a marching axis.
Vec3d AxisDirection(MarchAxis axis);

// Mirror reflection of a direction about a (not necessarily normalized) normal.
Vec3d Reflect(const Vec3d& dir, const Vec3d& normal);

}  // namespace lensgen

#endif  // CORE_OPTICS_H_
