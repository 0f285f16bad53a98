#include "config/surface_config.hpp"

#include <cmath>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "io/json_util.hpp"
#include "nlohmann/json.hpp"
#include "util/log.hpp"

namespace lensgen {

SurfaceConfig MakeDefaultConfig() {
  SurfaceConfig config{};
  config.fov_.horizontal_ = 90.0;
  config.fov_.vertical_ = 90.0;
  config.step_.horizontal_ = 1.0;
  config.step_.vertical_ = 1.0;
  config.seed_distance_ = 50.0;
  config.source_ = Vec3d{ 50.0, -10.0, 0.0 };
  config.max_march_steps_ = kDefaultMaxMarchSteps;
  return config;
}


namespace {

void CheckFov(double fov, const char* name) {
  if (!std::isfinite(fov) || fov <= 0.0 || fov >= 180.0) {
    throw LensError(ErrorKind::kInvalidConfiguration,
                    std::string(name) + " fov must be in (0, 180) degree, got " + std::to_string(fov));
  }
}

void CheckPositive(double v, const char* name) {
  if (!std::isfinite(v) || v <= 0.0) {
    throw LensError(ErrorKind::kInvalidConfiguration, std::string(name) + " must be positive, got " + std::to_string(v));
  }
}

}  // namespace


void ValidateConfig(const SurfaceConfig& config) {
  CheckFov(config.fov_.horizontal_, "horizontal");
  CheckFov(config.fov_.vertical_, "vertical");
  CheckPositive(config.step_.horizontal_, "horizontal step");
  CheckPositive(config.step_.vertical_, "vertical step");
  CheckPositive(config.seed_distance_, "seed distance");

  if (!config.source_.IsFinite()) {
    throw LensError(ErrorKind::kInvalidConfiguration, "source coordinates must be finite");
  }
  if (FloatEqualZero(Vec3d::Norm(config.source_))) {
    throw LensError(ErrorKind::kInvalidConfiguration, "source coincides with observer point");
  }
  if (FloatEqualZero(DiffNorm3(config.source_.val(), SeedPoint(config).val()))) {
    throw LensError(ErrorKind::kInvalidConfiguration, "source coincides with seed point");
  }
  if (config.max_march_steps_ == 0) {
    throw LensError(ErrorKind::kInvalidConfiguration, "max_march_steps must be positive");
  }
}


Vec3d SeedPoint(const SurfaceConfig& config) {
  double pt[3]{};
  pt[kObserverAxisIdx] = config.seed_distance_;
  return Vec3d{ pt };
}


SurfaceConfig LoadConfig(std::istream& is) {
  SurfaceConfig config{};
  try {
    nlohmann::json j;
    is >> j;
    j.get_to(config);
  } catch (const nlohmann::json::exception& e) {
    LOG_ERROR("Cannot parse configuration: %s", e.what());
    throw LensError(ErrorKind::kInvalidConfiguration, e.what());
  }
  ValidateConfig(config);
  return config;
}


void to_json(nlohmann::json& j, const Vec3d& v) {
  j = nlohmann::json::array({ v.x(), v.y(), v.z() });
}


void to_json(nlohmann::json& j, const SurfaceConfig& c) {
  j["fov"]["horizontal"] = c.fov_.horizontal_;
  j["fov"]["vertical"] = c.fov_.vertical_;
  j["step"]["horizontal"] = c.step_.horizontal_;
  j["step"]["vertical"] = c.step_.vertical_;
  j["seed_distance"] = c.seed_distance_;
  j["source"] = c.source_;
  j["max_march_steps"] = c.max_march_steps_;
}


void from_json(const nlohmann::json& j, SurfaceConfig& c) {
  c = MakeDefaultConfig();

  if (j.contains("fov")) {
    const auto& j_fov = j.at("fov");
    JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(j_fov, "horizontal", c.fov_.horizontal_)  // default 90
    JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(j_fov, "vertical", c.fov_.vertical_)      // default 90
  }
  if (j.contains("step")) {
    const auto& j_step = j.at("step");
    JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(j_step, "horizontal", c.step_.horizontal_)  // default 1
    JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(j_step, "vertical", c.step_.vertical_)      // default 1
  }
  JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(j, "seed_distance", c.seed_distance_)  // default 50

  if (j.contains("source")) {
    const auto& j_src = j.at("source");
    if (!j_src.is_array() || j_src.size() < 2 || j_src.size() > 3) {
      throw LensError(ErrorKind::kInvalidConfiguration, "source must be an array of 2 or 3 numbers");
    }
    double src[3]{};  // z defaults to 0 for a planar [x, y] source
    JSON_CHECK_AND_UPDATE_ARRAY_VALUE(j, "source", src, 3)
    c.source_ = Vec3d{ src };
  }

  if (j.contains("max_march_steps")) {
    auto n = j.at("max_march_steps").get<long long>();
    if (n <= 0) {
      throw LensError(ErrorKind::kInvalidConfiguration, "max_march_steps must be positive");
    }
    c.max_march_steps_ = static_cast<size_t>(n);
  }
}

}  // namespace lensgen
