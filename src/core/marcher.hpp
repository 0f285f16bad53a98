#ifndef CORE_MARCHER_H_
#define CORE_MARCHER_H_

#include <cstddef>

#include "config/surface_config.hpp"
#include "core/bounds.hpp"
#include "core/core_def.hpp"
#include "core/math.hpp"

namespace lensgen {

enum class MarchDirection {
  kPositive,
  kNegative,
};

enum class MarchState {
  kSeeded,
  kMarching,
  kDone,
};


/**
 * @brief Lazily walks along the surface from a seed point, in one direction of one axis.
 *
 * Each call of Next() evaluates the reflection normal at the current point, takes one tangent step and checks
 * the candidate against the field of view. The walker is done at the first candidate out of bounds, and that
 * candidate is dropped. Walking more than max_march_steps points raises ErrorKind::kMarchLimit.
 *
 * ~~~c++
 * MarchWalker walker(config, bounds, MarchAxis::kHorizontal, MarchDirection::kPositive, seed);
 * while (walker.Next()) {
 *   slice.emplace_back(walker.Current());
 * }
 * ~~~
 */
class MarchWalker {
 public:
  MarchWalker(const SurfaceConfig& config, const FovBounds& bounds, MarchAxis axis, MarchDirection direction,
              const Vec3d& seed);

  bool Next();

  const Vec3d& Current() const;
  MarchState State() const;
  size_t Steps() const;

 private:
  SurfaceConfig config_;
  FovBounds bounds_;
  MarchAxis axis_;
  double sign_;
  double step_len_;
  Vec3d curr_;
  MarchState state_;
  size_t steps_;
};


class SurfaceMarcher {
 public:
  /**
   * @throw LensError ErrorKind::kInvalidConfiguration if config does not pass ValidateConfig().
   */
  explicit SurfaceMarcher(const SurfaceConfig& config);

  /**
   * @brief Build one horizontal slice through a seed point.
   *
   * The slice is ordered by increasing x. Seed point appears exactly once, at the index equal to the number of
   * points found in the negative direction.
   */
  Slice BuildSlice(const Vec3d& seed) const;

  /**
   * @brief Build the whole surface, one slice per vertical step, ordered bottom to top.
   *
   * Any error aborts the build. There is no partial result.
   */
  Mesh BuildSurface(const Vec3d& seed) const;

  // Build from the seed point at seed distance along the observer axis.
  Mesh BuildSurface() const;

  const SurfaceConfig& config() const;
  const FovBounds& bounds() const;

 private:
  SurfaceConfig config_;
  FovBounds bounds_;
};


struct MeshStats {
  size_t slice_num_;
  size_t point_num_;
  size_t min_slice_size_;
  size_t max_slice_size_;
  Vec3d min_pt_;
  Vec3d max_pt_;
};

MeshStats ComputeMeshStats(const Mesh& mesh);

}  // namespace lensgen

#endif  // CORE_MARCHER_H_
