#include "normxcorr/config/configuration.hpp"
#include "normxcorr/core/errors.hpp"

#include <fstream>

namespace normxcorr::config {

static void read_int_triple(const YAML::Node& n, std::array<int, 3>& out) {
    if (n && n.IsSequence() && n.size() == 3) {
        out[0] = n[0].as<int>();
        out[1] = n[1].as<int>();
        out[2] = n[2].as<int>();
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["input"]) {
        auto i = node["input"];
        if (i["channel_reduction"]) cfg.input.channel_reduction = i["channel_reduction"].as<std::string>();
        if (i["fits_full_scale"]) cfg.input.fits_full_scale = i["fits_full_scale"].as<float>();
    }

    if (node["padding"]) {
        auto p = node["padding"];
        if (p["round_to_even"]) cfg.padding.round_to_even = p["round_to_even"].as<bool>();
        if (p["square"]) cfg.padding.square = p["square"].as<bool>();
    }

    if (node["stabilization"]) {
        auto s = node["stabilization"];
        if (s["stddev_floor"]) cfg.stabilization.stddev_floor = s["stddev_floor"].as<double>();
    }

    if (node["peak"]) {
        auto p = node["peak"];
        if (p["quantum_levels"]) cfg.peak.quantum_levels = p["quantum_levels"].as<int>();
        if (p["tolerance_quanta"]) cfg.peak.tolerance_quanta = p["tolerance_quanta"].as<double>();
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["parallel_terms"]) cfg.runtime.parallel_terms = r["parallel_terms"].as<bool>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["write_surface_fits"]) cfg.output.write_surface_fits = o["write_surface_fits"].as<bool>();
        if (o["write_surface_image"]) cfg.output.write_surface_image = o["write_surface_image"].as<bool>();
        if (o["surface_depth"]) cfg.output.surface_depth = o["surface_depth"].as<int>();
        if (o["clamp_negative"]) cfg.output.clamp_negative = o["clamp_negative"].as<bool>();
        if (o["stretch"]) cfg.output.stretch = o["stretch"].as<std::string>();
        if (o["stretch_low_percentile"]) {
            cfg.output.stretch_low_percentile = o["stretch_low_percentile"].as<float>();
        }
        if (o["stretch_high_percentile"]) {
            cfg.output.stretch_high_percentile = o["stretch_high_percentile"].as<float>();
        }
        if (o["match_image"]) cfg.output.match_image = o["match_image"].as<std::string>();
        read_int_triple(o["box_color"], cfg.output.box_color);
        if (o["box_thickness"]) cfg.output.box_thickness = o["box_thickness"].as<int>();
        if (o["overlay_opacity"]) cfg.output.overlay_opacity = o["overlay_opacity"].as<float>();
        if (o["write_report"]) cfg.output.write_report = o["write_report"].as<bool>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << to_yaml();
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["channel_reduction"] = input.channel_reduction;
    node["input"]["fits_full_scale"] = input.fits_full_scale;

    node["padding"]["round_to_even"] = padding.round_to_even;
    node["padding"]["square"] = padding.square;

    node["stabilization"]["stddev_floor"] = stabilization.stddev_floor;

    node["peak"]["quantum_levels"] = peak.quantum_levels;
    node["peak"]["tolerance_quanta"] = peak.tolerance_quanta;

    node["runtime"]["parallel_terms"] = runtime.parallel_terms;

    node["output"]["write_surface_fits"] = output.write_surface_fits;
    node["output"]["write_surface_image"] = output.write_surface_image;
    node["output"]["surface_depth"] = output.surface_depth;
    node["output"]["clamp_negative"] = output.clamp_negative;
    node["output"]["stretch"] = output.stretch;
    node["output"]["stretch_low_percentile"] = output.stretch_low_percentile;
    node["output"]["stretch_high_percentile"] = output.stretch_high_percentile;
    node["output"]["match_image"] = output.match_image;
    for (int c : output.box_color) {
        node["output"]["box_color"].push_back(c);
    }
    node["output"]["box_thickness"] = output.box_thickness;
    node["output"]["overlay_opacity"] = output.overlay_opacity;
    node["output"]["write_report"] = output.write_report;

    return node;
}

void Config::validate() const {
    if (input.channel_reduction != "rec709" && input.channel_reduction != "rec601" &&
        input.channel_reduction != "average") {
        throw ValidationError("input.channel_reduction must be 'rec709', 'rec601' or 'average'");
    }
    if (!(input.fits_full_scale >= 0.0f)) {
        throw ValidationError("input.fits_full_scale must be >= 0 (0 derives it from the file)");
    }

    if (!(stabilization.stddev_floor > 0.0) || stabilization.stddev_floor >= 1.0) {
        throw ValidationError("stabilization.stddev_floor must be in (0,1)");
    }

    if (peak.quantum_levels < 1) {
        throw ValidationError("peak.quantum_levels must be >= 1");
    }
    if (peak.tolerance_quanta < 0.0) {
        throw ValidationError("peak.tolerance_quanta must be >= 0");
    }

    if (output.surface_depth != 8 && output.surface_depth != 16) {
        throw ValidationError("output.surface_depth must be 8 or 16");
    }
    if (output.stretch != "none" && output.stretch != "minmax" && output.stretch != "percentile") {
        throw ValidationError("output.stretch must be 'none', 'minmax' or 'percentile'");
    }
    if (output.stretch_low_percentile < 0.0f || output.stretch_high_percentile > 100.0f ||
        output.stretch_low_percentile >= output.stretch_high_percentile) {
        throw ValidationError("output.stretch_low/high_percentile must satisfy 0 <= low < high <= 100");
    }
    if (output.match_image != "draw" && output.match_image != "overlay" && output.match_image != "none") {
        throw ValidationError("output.match_image must be 'draw', 'overlay' or 'none'");
    }
    for (int c : output.box_color) {
        if (c < 0 || c > 255) {
            throw ValidationError("output.box_color components must be in [0,255]");
        }
    }
    if (output.box_thickness < 1) {
        throw ValidationError("output.box_thickness must be >= 1");
    }
    if (output.overlay_opacity < 0.0f || output.overlay_opacity > 1.0f) {
        throw ValidationError("output.overlay_opacity must be in [0,1]");
    }
}

std::vector<std::string> check_config(const fs::path& path, const std::string& yaml_text) {
    std::vector<std::string> errors;
    try {
        const Config cfg = path.empty() ? Config::from_yaml(YAML::Load(yaml_text))
                                        : Config::load(path);
        cfg.validate();
    } catch (const NormXCorrError& e) {
        errors.emplace_back(e.what());
    } catch (const YAML::Exception& e) {
        errors.emplace_back(std::string("Config error: ") + e.what());
    }
    return errors;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "input": {
      "type": "object",
      "properties": {
        "channel_reduction": {"type": "string", "enum": ["rec709", "rec601", "average"]},
        "fits_full_scale": {"type": "number", "minimum": 0}
      }
    },
    "padding": {
      "type": "object",
      "properties": {
        "round_to_even": {"type": "boolean"},
        "square": {"type": "boolean"}
      }
    },
    "stabilization": {
      "type": "object",
      "properties": {
        "stddev_floor": {"type": "number", "exclusiveMinimum": 0, "exclusiveMaximum": 1}
      }
    },
    "peak": {
      "type": "object",
      "properties": {
        "quantum_levels": {"type": "integer", "minimum": 1},
        "tolerance_quanta": {"type": "number", "minimum": 0}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_terms": {"type": "boolean"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "write_surface_fits": {"type": "boolean"},
        "write_surface_image": {"type": "boolean"},
        "surface_depth": {"type": "integer", "enum": [8, 16]},
        "clamp_negative": {"type": "boolean"},
        "stretch": {"type": "string", "enum": ["none", "minmax", "percentile"]},
        "stretch_low_percentile": {"type": "number", "minimum": 0, "maximum": 100},
        "stretch_high_percentile": {"type": "number", "minimum": 0, "maximum": 100},
        "match_image": {"type": "string", "enum": ["draw", "overlay", "none"]},
        "box_color": {"type": "array", "items": {"type": "integer", "minimum": 0, "maximum": 255}, "minItems": 3, "maxItems": 3},
        "box_thickness": {"type": "integer", "minimum": 1},
        "overlay_opacity": {"type": "number", "minimum": 0, "maximum": 1},
        "write_report": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace normxcorr::config
