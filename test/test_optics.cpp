#include <gtest/gtest.h>

#include <cmath>

#include "core/error.hpp"
#include "core/optics.hpp"

using namespace lensgen;

namespace {

constexpr double kEps = 1e-9;

class OpticsTest : public ::testing::Test {
 protected:
  void SetUp() override { source_ = Vec3d{ 50.0, -10.0, 0.0 }; }

  Vec3d source_;
};


TEST_F(OpticsTest, NormalFollowsReflectionLaw) {
  Vec3d pts[]{
    { 0.0, 50.0, 0.0 },
    { 10.0, 48.0, 5.0 },
    { -20.0, 45.0, -12.0 },
    { 30.0, 60.0, 25.0 },
  };

  for (const auto& p : pts) {
    auto n = ReflectionNormal(p, source_);
    ASSERT_GT(Vec3d::Norm(n), kEps);

    // A ray from the source hits p and must go to the observer after reflection.
    auto d_in = (p - source_).Normalized();
    auto d_out = Reflect(d_in, n);
    auto d_expect = (-p).Normalized();
    EXPECT_NEAR(d_out.x(), d_expect.x(), kEps);
    EXPECT_NEAR(d_out.y(), d_expect.y(), kEps);
    EXPECT_NEAR(d_out.z(), d_expect.z(), kEps);
  }
}

TEST_F(OpticsTest, NormalFacesObserver) {
  Vec3d p{ 0.0, 50.0, 0.0 };
  auto n = ReflectionNormal(p, source_);
  auto d = std::sqrt(50.0 * 50.0 + 60.0 * 60.0);
  EXPECT_LT(Vec3d::Dot(n, p), 0.0);
  EXPECT_NEAR(n.x(), 50.0 / d, kEps);
  EXPECT_NEAR(n.y(), -1.0 - 60.0 / d, kEps);
  EXPECT_NEAR(n.z(), 0.0, kEps);
}

TEST_F(OpticsTest, NormalDirectionInvariantToSceneScale) {
  Vec3d p{ 12.0, 47.0, -6.0 };
  auto n1 = ReflectionNormal(p, source_).Normalized();
  for (double s : { 0.1, 2.0, 37.5 }) {
    auto n2 = ReflectionNormal(p * s, source_ * s).Normalized();
    EXPECT_NEAR(n1.x(), n2.x(), kEps);
    EXPECT_NEAR(n1.y(), n2.y(), kEps);
    EXPECT_NEAR(n1.z(), n2.z(), kEps);
  }
}

TEST_F(OpticsTest, NormalDegenerateInput) {
  try {
    ReflectionNormal(Vec3d{ 0, 0, 0 }, source_);
    FAIL() << "observer point accepted";
  } catch (const LensError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kDegenerateInput);
  }

  try {
    ReflectionNormal(source_, source_);
    FAIL() << "source point accepted";
  } catch (const LensError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kDegenerateInput);
  }

  try {
    ReflectionNormal(source_ * 0.5, source_);
    FAIL() << "point between observer and source accepted";
  } catch (const LensError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kDegenerateInput);
  }
}


TEST_F(OpticsTest, HorizontalStep) {
  Vec3d p{ 7.0, 49.0, 3.0 };
  auto n = ReflectionNormal(p, source_);
  for (double len : { 0.25, 1.0, 3.0 }) {
    auto step = TangentStep(n, MarchAxis::kHorizontal, len);
    EXPECT_NEAR(Vec3d::Norm(step), len, kEps);
    EXPECT_NEAR(Vec3d::Dot(step, n), 0.0, kEps);
    EXPECT_NEAR(step.z(), 0.0, kEps);
    EXPECT_GE(step.x(), 0.0);
  }
}

TEST_F(OpticsTest, VerticalStep) {
  Vec3d p{ -4.0, 51.0, 8.0 };
  auto n = ReflectionNormal(p, source_);
  auto step = TangentStep(n, MarchAxis::kVertical, 2.0);
  EXPECT_NEAR(Vec3d::Norm(step), 2.0, kEps);
  EXPECT_NEAR(Vec3d::Dot(step, n), 0.0, kEps);
  EXPECT_NEAR(step.x(), 0.0, kEps);
  EXPECT_GE(step.z(), 0.0);
}

TEST_F(OpticsTest, StepSignIsCanonical) {
  // Opposite normals span the same tangent plane. Step must not change.
  Vec3d n{ 0.3, -1.2, 0.1 };
  auto s1 = TangentStep(n, MarchAxis::kHorizontal, 1.0);
  auto s2 = TangentStep(-n, MarchAxis::kHorizontal, 1.0);
  EXPECT_EQ(s1, s2);
  EXPECT_GT(s1.x(), 0.0);

  auto v1 = TangentStep(n, MarchAxis::kVertical, 1.0);
  auto v2 = TangentStep(-n, MarchAxis::kVertical, 1.0);
  EXPECT_EQ(v1, v2);
  EXPECT_GT(v1.z(), 0.0);
}

TEST_F(OpticsTest, DegenerateTangent) {
  try {
    TangentStep(Vec3d{ 0, 0, 2 }, MarchAxis::kHorizontal, 1.0);
    FAIL() << "normal parallel to vertical axis accepted";
  } catch (const LensError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kDegenerateTangent);
  }

  try {
    TangentStep(Vec3d{ -1, 0, 0 }, MarchAxis::kVertical, 1.0);
    FAIL() << "normal parallel to horizontal axis accepted";
  } catch (const LensError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kDegenerateTangent);
  }
}

TEST_F(OpticsTest, ZeroStepRejected) {
  Vec3d n{ 0.3, -1.2, 0.1 };
  try {
    TangentStep(n, MarchAxis::kHorizontal, 0.0);
    FAIL() << "zero step accepted";
  } catch (const LensError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kInvalidConfiguration);
  }
}

}  // namespace
