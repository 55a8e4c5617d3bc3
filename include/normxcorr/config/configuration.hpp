#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace normxcorr::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string channel_reduction = "rec709"; // rec709 | rec601 | average
  float fits_full_scale = 0.0f; // 0: from the file's BITPIX/BZERO
};

struct PaddingConfig {
  bool round_to_even = true;
  bool square = true;
};

struct StabilizationConfig {
  // Local / template standard deviation below this fraction of full scale
  // disables the division.
  double stddev_floor = 0.002;
};

struct PeakConfig {
  int quantum_levels = 65535;
  double tolerance_quanta = 1.0;

  double tolerance() const {
    return tolerance_quanta / static_cast<double>(quantum_levels);
  }
};

struct RuntimeConfig {
  bool parallel_terms = true;
};

struct OutputConfig {
  bool write_surface_fits = true;
  bool write_surface_image = true;
  int surface_depth = 8;             // 8 | 16
  bool clamp_negative = true;
  std::string stretch = "none";      // none | minmax | percentile
  float stretch_low_percentile = 1.0f;
  float stretch_high_percentile = 99.0f;
  std::string match_image = "draw";  // draw | overlay | none
  std::array<int, 3> box_color{255, 0, 0};
  int box_thickness = 1;
  float overlay_opacity = 0.5f;
  bool write_report = true;
};

struct Config {
  InputConfig input;
  PaddingConfig padding;
  StabilizationConfig stabilization;
  PeakConfig peak;
  RuntimeConfig runtime;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

// Loads a config from path (when not empty, via Config::load) or from
// yaml_text, then validates it. Returns the error messages; empty when valid.
std::vector<std::string> check_config(const fs::path &path, const std::string &yaml_text);

} // namespace normxcorr::config
