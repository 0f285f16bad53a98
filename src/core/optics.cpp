#include "core/optics.hpp"

#include <cmath>
#include <cstdio>
#include <string>

#include "core/error.hpp"

namespace lensgen {

namespace {

std::string PointString(const Vec3d& pt) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "(%.6f, %.6f, %.6f)", pt.x(), pt.y(), pt.z());
  return buf;
}

}  // namespace


const char* AxisName(MarchAxis axis) {
  switch (axis) {
    case MarchAxis::kHorizontal:
      return "horizontal";
    case MarchAxis::kVertical:
      return "vertical";
  }
  return "";
}


Vec3d AxisDirection(MarchAxis axis) {
  switch (axis) {
    case MarchAxis::kHorizontal:
      return Vec3d{ 1.0, 0.0, 0.0 };
    case MarchAxis::kVertical:
    default:
      return Vec3d{ 0.0, 0.0, 1.0 };
  }
}


Vec3d ReflectionNormal(const Vec3d& pt, const Vec3d& source) {
  double to_obs[3]{ -pt.x(), -pt.y(), -pt.z() };
  if (!Normalize3(to_obs)) {
    throw LensError(ErrorKind::kDegenerateInput, "surface point coincides with observer point");
  }

  double to_src[3];
  Vec3FromTo(pt.val(), source.val(), to_src);
  if (!Normalize3(to_src)) {
    throw LensError(ErrorKind::kDegenerateInput, "surface point coincides with source " + PointString(source));
  }

  Vec3d normal = Vec3d{ to_obs } + Vec3d{ to_src };
  if (FloatEqualZero(Vec3d::Norm(normal))) {
    throw LensError(ErrorKind::kDegenerateInput,
                    "surface point " + PointString(pt) + " lies between observer and source");
  }
  return normal;
}


Vec3d TangentStep(const Vec3d& normal, MarchAxis axis, double step_len) {
  if (!(step_len > 0.0)) {
    throw LensError(ErrorKind::kInvalidConfiguration, "step length must be positive");
  }

  // Cross with the *other* axis, so the result lies in the marching plane.
  auto cross_axis = AxisDirection(axis == MarchAxis::kHorizontal ? MarchAxis::kVertical : MarchAxis::kHorizontal);
  auto step = Vec3d::Cross(normal, cross_axis);
  auto len = Vec3d::Norm(step);
  if (FloatEqualZero(len) || !std::isfinite(len)) {
    throw LensError(ErrorKind::kDegenerateTangent,
                    std::string("normal ") + PointString(normal) + " is parallel to " +
                        AxisName(axis == MarchAxis::kHorizontal ? MarchAxis::kVertical : MarchAxis::kHorizontal) +
                        " axis");
  }

  step *= step_len / len;
  if (Vec3d::Dot(step, AxisDirection(axis)) < 0.0) {
    step = -step;
  }
  return step;
}


Vec3d Reflect(const Vec3d& dir, const Vec3d& normal) {
  auto n = normal.Normalized();
  return dir - 2.0 * Vec3d::Dot(dir, n) * n;
}

}  // namespace lensgen
