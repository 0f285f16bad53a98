#ifndef CORE_CORE_DEF_H_
#define CORE_CORE_DEF_H_

#include <cstddef>
#include <vector>

#include "core/math.hpp"

namespace lensgen {

// Principal marching axes. Horizontal is +x (out of the right ear), vertical is +z (up out of the head).
enum class MarchAxis {
  kHorizontal,
  kVertical,
};

// Observer axis is +y (out of the face).
constexpr int kObserverAxisIdx = 1;

using Slice = std::vector<Vec3d>;  // Ordered left to right.
using Mesh = std::vector<Slice>;   // Ordered bottom to top.

constexpr size_t kDefaultMaxMarchSteps = 100000;

const char* AxisName(MarchAxis axis);

}  // namespace lensgen

#endif  // CORE_CORE_DEF_H_
