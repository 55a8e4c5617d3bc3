#include "match_command.hpp"

#include "normxcorr/config/configuration.hpp"
#include "normxcorr/core/errors.hpp"
#include "normxcorr/core/events.hpp"
#include "normxcorr/core/types.hpp"
#include "normxcorr/core/utils.hpp"
#include "normxcorr/io/fits_io.hpp"
#include "normxcorr/io/image_io.hpp"
#include "normxcorr/pipeline/match_runner.hpp"
#include "normxcorr/render/presentation.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace {

using normxcorr::Phase;
using normxcorr::Raster;

namespace core = normxcorr::core;
namespace io = normxcorr::io;
namespace pipeline = normxcorr::pipeline;
namespace render = normxcorr::render;

core::json write_artifacts(const normxcorr::config::Config &cfg, const fs::path &out,
                           const Raster &tmpl, const Raster &search,
                           const pipeline::MatchRunResult &res) {
  const render::RenderOptions ropts = pipeline::make_render_options(cfg);
  core::json written = core::json::array();

  if (cfg.output.write_surface_fits) {
    io::FitsHeader hdr;
    hdr.set("PEAKX", res.match.col);
    hdr.set("PEAKY", res.match.row);
    hdr.set("PEAKVAL", res.match.score);
    hdr.set("TMPLW", tmpl.width());
    hdr.set("TMPLH", tmpl.height());
    hdr.set("CREATOR", std::string("normxcorr"));
    const fs::path p = out / "surface.fits";
    io::write_fits_float(p, res.surface.scores().cast<float>(), hdr);
    written.push_back(p.filename().string());
  }

  if (cfg.output.write_surface_image) {
    const fs::path p = out / "surface.png";
    render::write_image(p, render::encode_display(render::to_display(res.surface, ropts),
                                                  ropts.depth));
    written.push_back(p.filename().string());
  }

  if (cfg.output.match_image == "draw") {
    const fs::path p = out / "match.png";
    render::write_image(p, render::draw_match_box(search, res.match, tmpl.width(),
                                                  tmpl.height(), ropts));
    written.push_back(p.filename().string());
  } else if (cfg.output.match_image == "overlay") {
    const fs::path p = out / "match.png";
    render::write_image(p, render::overlay_template(search, tmpl, res.match, ropts));
    written.push_back(p.filename().string());
  }

  return written;
}

} // namespace

int run_match_command(const std::string &template_path,
                      const std::string &search_path,
                      const std::string &config_path,
                      const std::string &out_dir,
                      const std::string &run_id_override) {
  normxcorr::config::Config cfg;
  try {
    if (!config_path.empty()) {
      cfg = normxcorr::config::Config::load(config_path);
    }
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const std::string run_id = run_id_override.empty() ? core::get_run_id() : run_id_override;
  const fs::path out = out_dir.empty() ? fs::path(".") : fs::path(out_dir);

  std::error_code ec;
  fs::create_directories(out, ec);
  if (ec) {
    std::cerr << "Error: cannot create output directory " << out << ": " << ec.message()
              << std::endl;
    return 1;
  }

  std::ofstream log_file(out / "events.jsonl", std::ios::out | std::ios::trunc);
  if (!log_file) {
    std::cerr << "Error: cannot open " << (out / "events.jsonl") << std::endl;
    return 1;
  }

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"template", template_path},
                     {"search", search_path},
                     {"config", config_path},
                     {"out_dir", out.string()}},
                    log_file);

  try {
    const auto reduction = io::string_to_channel_reduction(cfg.input.channel_reduction);
    const Raster tmpl = io::load_raster(template_path, reduction, cfg.input.fits_full_scale);
    const Raster search = io::load_raster(search_path, reduction, cfg.input.fits_full_scale);
    std::cout << "[load] template " << tmpl.width() << "x" << tmpl.height() << ", search "
              << search.width() << "x" << search.height() << std::endl;

    const pipeline::MatchRunResult res =
        pipeline::run_match_phases(run_id, cfg, tmpl, search, emitter, log_file);
    std::cout << "[correlate] padded canvas " << res.padded_size.width << "x"
              << res.padded_size.height << std::endl;

    emitter.phase_start(run_id, Phase::RENDER, log_file);
    core::json written = write_artifacts(cfg, out, tmpl, search, res);
    emitter.phase_end(run_id, Phase::RENDER, "ok", {{"artifacts", written}}, log_file);

    if (cfg.output.write_report) {
      core::json report;
      report["run_id"] = run_id;
      report["template"] = {{"path", template_path},
                            {"width", tmpl.width()},
                            {"height", tmpl.height()},
                            {"full_scale", tmpl.full_scale},
                            {"mean", res.template_stats.mean},
                            {"std", res.template_stats.stddev},
                            {"sha256", core::sha256_file(template_path)}};
      report["search"] = {{"path", search_path},
                          {"width", search.width()},
                          {"height", search.height()},
                          {"full_scale", search.full_scale},
                          {"mean", res.search_stats.mean},
                          {"std", res.search_stats.stddev},
                          {"sha256", core::sha256_file(search_path)}};
      report["padded"] = {{"width", res.padded_size.width},
                          {"height", res.padded_size.height}};
      report["match"] = {{"col", res.match.col},
                         {"row", res.match.row},
                         {"score", res.match.score}};
      report["phase_seconds"] = res.phase_seconds;
      report["artifacts"] = written;
      report["config"] = YAML::Dump(cfg.to_yaml());
      core::write_text(out / "report.json", report.dump(2));
    }

    std::cout << render::format_match_line(res.match) << std::endl;
    emitter.phase_start(run_id, Phase::DONE, log_file);
    emitter.phase_end(run_id, Phase::DONE, "ok", core::json::object(), log_file);
    emitter.run_end(run_id, true, "ok", log_file);
  } catch (const std::exception &e) {
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
