#include <gtest/gtest.h>

#include <cmath>

#include "config/surface_config.hpp"
#include "core/bounds.hpp"
#include "core/error.hpp"

using namespace lensgen;

namespace {

class BoundsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = MakeDefaultConfig();
    config_.fov_.horizontal_ = 60.0;
    config_.fov_.vertical_ = 40.0;
  }

  SurfaceConfig config_;
};


TEST_F(BoundsTest, Radius) {
  FovBounds bounds(config_);
  EXPECT_NEAR(bounds.h_radius(), 50.0 * std::tan(30.0 * math::kDegreeToRad), 1e-9);
  EXPECT_NEAR(bounds.v_radius(), 50.0 * std::tan(20.0 * math::kDegreeToRad), 1e-9);
}

TEST_F(BoundsTest, SeedIsInside) {
  FovBounds bounds(config_);
  EXPECT_TRUE(bounds.Contains(SeedPoint(config_)));
  EXPECT_TRUE(bounds.Contains(Vec3d{ 0.0, 1.0, 0.0 }));
}

TEST_F(BoundsTest, Ellipse) {
  FovBounds bounds(config_);
  auto rh = bounds.h_radius();
  auto rv = bounds.v_radius();

  EXPECT_TRUE(bounds.Contains(Vec3d{ 0.99 * rh, 50.0, 0.0 }));
  EXPECT_FALSE(bounds.Contains(Vec3d{ 1.01 * rh, 50.0, 0.0 }));
  EXPECT_TRUE(bounds.Contains(Vec3d{ 0.0, 50.0, -0.99 * rv }));
  EXPECT_FALSE(bounds.Contains(Vec3d{ 0.0, 50.0, -1.01 * rv }));

  // Inside the bounding box but outside the ellipse
  EXPECT_FALSE(bounds.Contains(Vec3d{ 0.8 * rh, 50.0, 0.8 * rv }));
  EXPECT_TRUE(bounds.Contains(Vec3d{ 0.7 * rh, 50.0, 0.7 * rv }));
}

TEST_F(BoundsTest, ProjectionAlongViewRay) {
  FovBounds bounds(config_);
  auto rh = bounds.h_radius();

  // Same view direction, different depth
  EXPECT_TRUE(bounds.Contains(Vec3d{ 0.9 * rh * 2.0, 100.0, 0.0 }));
  EXPECT_TRUE(bounds.Contains(Vec3d{ 0.9 * rh * 0.1, 5.0, 0.0 }));
  EXPECT_FALSE(bounds.Contains(Vec3d{ 1.1 * rh * 3.0, 150.0, 0.0 }));

  auto p = bounds.Project(Vec3d{ 10.0, 100.0, -4.0 });
  EXPECT_NEAR(p.x(), 5.0, 1e-12);
  EXPECT_NEAR(p.y(), 50.0, 1e-12);
  EXPECT_NEAR(p.z(), -2.0, 1e-12);
}

TEST_F(BoundsTest, BehindObserver) {
  FovBounds bounds(config_);
  EXPECT_FALSE(bounds.Contains(Vec3d{ 0.0, -50.0, 0.0 }));
  EXPECT_FALSE(bounds.Contains(Vec3d{ 1.0, -0.5, 0.0 }));
}

TEST_F(BoundsTest, ZeroDepth) {
  FovBounds bounds(config_);
  try {
    bounds.Contains(Vec3d{ 1.0, 0.0, 1.0 });
    FAIL() << "zero depth accepted";
  } catch (const LensError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kDegenerateProjection);
  }
}

TEST_F(BoundsTest, NoReentryAlongAxis) {
  FovBounds bounds(config_);
  bool inside = true;
  for (int i = 0; i < 200; i++) {
    bool curr = bounds.Contains(Vec3d{ i * 0.5, 50.0, 0.0 });
    if (!inside) {
      EXPECT_FALSE(curr) << "re-entered at step " << i;
    }
    inside = curr;
  }
  EXPECT_FALSE(inside);
}

}  // namespace
