#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>

#include "config/surface_config.hpp"
#include "core/error.hpp"
#include "core/marcher.hpp"
#include "io/file.hpp"
#include "io/slice_exporter.hpp"
#include "util/arg_parser.hpp"
#include "util/log.hpp"


int main(int argc, char** argv) {
  // Setup argument parser and parse arguments
  lensgen::ArgParser parser;
  parser.AddArgument("-v", 0, "verbose", "make output verbose");
  parser.AddArgument("-d", 0, "debug", "display debug info");
  parser.AddArgument("-h", 0, "help", "show this help");
  parser.AddArgument("-s", 0, "summary", "also write mesh.json for visualization (needs -o)");
  parser.AddArgument("-f", -1, "config-file", "config file, default values are used if not given");
  parser.AddArgument("-o", -1, "out-dir", "directory for slice files, nothing is written if not given");
  parser.AddArgument("--prefix", -1, "prefix", "slice file name prefix, default slice_");
  parser.AddArgument("--tsv", 0, "tsv", "separate coordinates with tab instead of comma");
  lensgen::ArgParseResult arg_parse_result;
  std::string config_filename;
  std::string out_dir;
  std::string prefix;
  try {
    arg_parse_result = parser.Parse(argc, argv);
    config_filename = lensgen::GetArgValue(arg_parse_result, "-f", "");
    out_dir = lensgen::GetArgValue(arg_parse_result, "-o", "");
    prefix = lensgen::GetArgValue(arg_parse_result, "--prefix", "");
  } catch (const std::invalid_argument& e) {
    LOG_ERROR("%s", e.what());
    return -1;
  }

  if (arg_parse_result.count("-h")) {
    parser.ShowHelp(argv[0]);
    return 0;
  }

  // Setup log levels
  if (arg_parse_result.count("-d")) {
    lensgen::Logger::GetInstance()->AddDestination({ lensgen::LogLevel::kDebug, lensgen::LogLevel::kVerbose },
                                                   lensgen::LogStreamDest::Stdout());
  } else if (arg_parse_result.count("-v")) {
    lensgen::Logger::GetInstance()->AddDestination({ lensgen::LogLevel::kVerbose }, lensgen::LogStreamDest::Stdout());
  }

  try {
    // Load configuration
    auto config = lensgen::MakeDefaultConfig();
    if (!config_filename.empty()) {
      std::ifstream config_file(config_filename);
      if (!config_file) {
        LOG_ERROR("Cannot open config file %s", config_filename.c_str());
        return -1;
      }
      config = lensgen::LoadConfig(config_file);
    } else {
      LOG_INFO("No config file. Use default configuration.");
    }
    LOG_VERBOSE("config: fov %.1f x %.1f deg, step %.3f x %.3f mm, seed distance %.3f mm, source (%.3f, %.3f, %.3f)",
                config.fov_.horizontal_, config.fov_.vertical_, config.step_.horizontal_, config.step_.vertical_,
                config.seed_distance_, config.source_.x(), config.source_.y(), config.source_.z());

    // Build surface
    auto t0 = std::chrono::system_clock::now();
    lensgen::SurfaceMarcher marcher(config);
    auto mesh = marcher.BuildSurface();
    auto t1 = std::chrono::system_clock::now();
    std::chrono::duration<double> diff = t1 - t0;

    auto stats = lensgen::ComputeMeshStats(mesh);
    LOG_INFO("Surface: %zu slices, %zu points, %zu ~ %zu points per slice. %.2fms", stats.slice_num_,
             stats.point_num_, stats.min_slice_size_, stats.max_slice_size_, diff.count() * 1.0e3);
    LOG_INFO("Bounding box: (%.3f, %.3f, %.3f) ~ (%.3f, %.3f, %.3f)", stats.min_pt_.x(), stats.min_pt_.y(),
             stats.min_pt_.z(), stats.max_pt_.x(), stats.max_pt_.y(), stats.max_pt_.z());

    // Export
    if (out_dir.empty()) {
      if (arg_parse_result.count("-s")) {
        LOG_WARNING("-s is ignored without -o");
      }
      return 0;
    }

    auto option = lensgen::MakeDefaultExportOption(out_dir);
    if (!prefix.empty()) {
      option.prefix_ = prefix;
    }
    if (arg_parse_result.count("--tsv")) {
      option.delimiter_ = '\t';
    }
    auto files = lensgen::ExportSlices(mesh, option);
    LOG_INFO("%zu slice files written to %s", files.size(), out_dir.c_str());

    if (arg_parse_result.count("-s")) {
      auto summary_file = lensgen::PathJoin(out_dir, "mesh.json");
      lensgen::WriteMeshSummary(summary_file, mesh, config);
      LOG_INFO("Mesh summary written to %s", summary_file.c_str());
    }
  } catch (const lensgen::LensError& e) {
    LOG_ERROR("%s", e.what());
    return -1;
  }

  return 0;
}
