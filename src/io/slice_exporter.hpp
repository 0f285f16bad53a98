#ifndef IO_SLICE_EXPORTER_H_
#define IO_SLICE_EXPORTER_H_

#include <cstddef>
#include <string>
#include <vector>

#include "config/surface_config.hpp"
#include "core/core_def.hpp"
#include "nlohmann/json.hpp"

namespace lensgen {

struct ExportOption {
  std::string dir_;
  std::string prefix_;
  char delimiter_;
  int precision_;
};

ExportOption MakeDefaultExportOption(const std::string& dir);

/**
 * @brief File name for the idx-th slice, like `slice_007.csv`. Index is zero padded to at least 3 digits, or
 *        more when there are 1000 slices or above.
 */
std::string SliceFileName(const ExportOption& option, size_t idx, size_t slice_num);

/**
 * @brief Write every slice to its own text file, one point per line (x, y, z).
 *
 * Slices are numbered from bottom to top. Such files can be imported by CAD tools as curves through XYZ points.
 *
 * @return paths of written files, in slice order.
 * @throw LensError ErrorKind::kIo on any file failure.
 */
std::vector<std::string> ExportSlices(const Mesh& mesh, const ExportOption& option);

/**
 * @brief Write the mesh together with observer, source and configuration as one JSON document, for
 *        visualization tools.
 *
 * @throw LensError ErrorKind::kIo on any file failure.
 */
void WriteMeshSummary(const std::string& filename, const Mesh& mesh, const SurfaceConfig& config);

nlohmann::json MakeMeshSummary(const Mesh& mesh, const SurfaceConfig& config);

}  // namespace lensgen

#endif  // IO_SLICE_EXPORTER_H_
