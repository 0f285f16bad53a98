#include "io/slice_exporter.hpp"

#include <cstdio>

#include "core/error.hpp"
#include "io/file.hpp"
#include "util/log.hpp"

namespace lensgen {

ExportOption MakeDefaultExportOption(const std::string& dir) {
  return ExportOption{ dir, "slice_", ',', 6 };
}


std::string SliceFileName(const ExportOption& option, size_t idx, size_t slice_num) {
  int width = 3;
  for (size_t n = 1000; n <= slice_num && width < 20; n *= 10) {
    width++;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%0*zu", width, idx);
  return option.prefix_ + buf + (option.delimiter_ == '\t' ? ".txt" : ".csv");
}


std::vector<std::string> ExportSlices(const Mesh& mesh, const ExportOption& option) {
  std::vector<std::string> paths;
  char fmt[32];
  std::snprintf(fmt, sizeof(fmt), "%%.%df%c%%.%df%c%%.%df\n", option.precision_, option.delimiter_,
                option.precision_, option.delimiter_, option.precision_);

  for (size_t i = 0; i < mesh.size(); i++) {
    auto filename = SliceFileName(option, i, mesh.size());
    File file(PathJoin(option.dir_, filename).c_str());
    if (!file.Open()) {
      throw LensError(ErrorKind::kIo, "cannot open " + file.GetPath().string() + " for writing");
    }
    // A failed write sticks to the file and shows up in Close().
    for (const auto& p : mesh[i]) {
      file.Printf(fmt, p.x(), p.y(), p.z());
    }
    if (!file.Close()) {
      throw LensError(ErrorKind::kIo, "cannot write " + file.GetPath().string());
    }
    LOG_TAG_DEBUG("export", "write slice %zu (%zu points) to %s", i, mesh[i].size(), file.GetPath().string().c_str());
    paths.emplace_back(file.GetPath().string());
  }

  LOG_VERBOSE("%zu slices exported to %s", paths.size(), option.dir_.c_str());
  return paths;
}


nlohmann::json MakeMeshSummary(const Mesh& mesh, const SurfaceConfig& config) {
  nlohmann::json j;
  j["observer"] = Vec3d{};
  j["source"] = config.source_;
  j["config"] = config;
  j["slices"] = mesh;
  return j;
}


void WriteMeshSummary(const std::string& filename, const Mesh& mesh, const SurfaceConfig& config) {
  File file(filename.c_str());
  if (!file.Open()) {
    throw LensError(ErrorKind::kIo, "cannot open " + filename + " for writing");
  }
  auto text = MakeMeshSummary(mesh, config).dump(2) + "\n";
  if (file.Write(text) != text.size() || !file.Close()) {
    throw LensError(ErrorKind::kIo, "cannot write " + filename);
  }
}

}  // namespace lensgen
