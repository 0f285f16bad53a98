#include "core/marcher.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

#include "core/error.hpp"
#include "core/optics.hpp"
#include "util/log.hpp"

namespace lensgen {

MarchWalker::MarchWalker(const SurfaceConfig& config, const FovBounds& bounds, MarchAxis axis,
                         MarchDirection direction, const Vec3d& seed)
    : config_(config), bounds_(bounds), axis_(axis), sign_(direction == MarchDirection::kPositive ? 1.0 : -1.0),
      step_len_(axis == MarchAxis::kHorizontal ? config.step_.horizontal_ : config.step_.vertical_), curr_(seed),
      state_(MarchState::kSeeded), steps_(0) {}


bool MarchWalker::Next() {
  if (state_ == MarchState::kDone) {
    return false;
  }
  state_ = MarchState::kMarching;

  auto normal = ReflectionNormal(curr_, config_.source_);
  auto candidate = curr_ + TangentStep(normal, axis_, step_len_) * sign_;
  if (!bounds_.Contains(candidate)) {
    state_ = MarchState::kDone;
    return false;
  }

  if (steps_ >= config_.max_march_steps_) {
    throw LensError(ErrorKind::kMarchLimit, std::string("more than ") + std::to_string(config_.max_march_steps_) +
                                                " steps along " + AxisName(axis_) + " axis");
  }
  curr_ = candidate;
  steps_++;
  return true;
}


const Vec3d& MarchWalker::Current() const {
  return curr_;
}


MarchState MarchWalker::State() const {
  return state_;
}


size_t MarchWalker::Steps() const {
  return steps_;
}


SurfaceMarcher::SurfaceMarcher(const SurfaceConfig& config) : config_(config), bounds_(config) {
  ValidateConfig(config_);
}


Slice SurfaceMarcher::BuildSlice(const Vec3d& seed) const {
  Slice negative;
  MarchWalker neg_walker(config_, bounds_, MarchAxis::kHorizontal, MarchDirection::kNegative, seed);
  while (neg_walker.Next()) {
    negative.emplace_back(neg_walker.Current());
  }

  Slice slice(negative.rbegin(), negative.rend());
  slice.emplace_back(seed);

  MarchWalker pos_walker(config_, bounds_, MarchAxis::kHorizontal, MarchDirection::kPositive, seed);
  while (pos_walker.Next()) {
    slice.emplace_back(pos_walker.Current());
  }

  LOG_TAG_DEBUG("march", "slice at z = %.3f: %zu points (%zu left, %zu right)", seed.z(), slice.size(), neg_walker.Steps(),
            pos_walker.Steps());
  return slice;
}


Mesh SurfaceMarcher::BuildSurface(const Vec3d& seed) const {
  if (!bounds_.Contains(seed)) {
    LOG_WARNING("seed point (%.3f, %.3f, %.3f) is out of field of view", seed.x(), seed.y(), seed.z());
  }

  Mesh lower;
  MarchWalker down_walker(config_, bounds_, MarchAxis::kVertical, MarchDirection::kNegative, seed);
  while (down_walker.Next()) {
    lower.emplace_back(BuildSlice(down_walker.Current()));
  }

  Mesh mesh;
  mesh.reserve(lower.size() + 1);
  std::move(lower.rbegin(), lower.rend(), std::back_inserter(mesh));
  mesh.emplace_back(BuildSlice(seed));

  MarchWalker up_walker(config_, bounds_, MarchAxis::kVertical, MarchDirection::kPositive, seed);
  while (up_walker.Next()) {
    mesh.emplace_back(BuildSlice(up_walker.Current()));
  }

  LOG_VERBOSE("surface built: %zu slices (%zu below seed, %zu above)", mesh.size(), down_walker.Steps(),
              up_walker.Steps());
  return mesh;
}


Mesh SurfaceMarcher::BuildSurface() const {
  return BuildSurface(SeedPoint(config_));
}


const SurfaceConfig& SurfaceMarcher::config() const {
  return config_;
}


const FovBounds& SurfaceMarcher::bounds() const {
  return bounds_;
}


MeshStats ComputeMeshStats(const Mesh& mesh) {
  MeshStats stats{};
  stats.slice_num_ = mesh.size();
  stats.min_slice_size_ = mesh.empty() ? 0 : mesh.front().size();

  bool first = true;
  double min_pt[3]{};
  double max_pt[3]{};
  for (const auto& slice : mesh) {
    stats.point_num_ += slice.size();
    stats.min_slice_size_ = std::min(stats.min_slice_size_, slice.size());
    stats.max_slice_size_ = std::max(stats.max_slice_size_, slice.size());
    for (const auto& p : slice) {
      for (int i = 0; i < 3; i++) {
        if (first || p.val()[i] < min_pt[i]) {
          min_pt[i] = p.val()[i];
        }
        if (first || p.val()[i] > max_pt[i]) {
          max_pt[i] = p.val()[i];
        }
      }
      first = false;
    }
  }
  stats.min_pt_ = Vec3d{ min_pt };
  stats.max_pt_ = Vec3d{ max_pt };
  return stats;
}

}  // namespace lensgen
