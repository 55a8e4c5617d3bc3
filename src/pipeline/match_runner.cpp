#include "normxcorr/pipeline/match_runner.hpp"

#include "normxcorr/correlation/correlator.hpp"
#include "normxcorr/correlation/normalizer.hpp"
#include "normxcorr/correlation/padding.hpp"
#include "normxcorr/correlation/peak.hpp"

#include <chrono>
#include <exception>

namespace normxcorr::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point t0) {
  return std::chrono::duration<double>(Clock::now() - t0).count();
}

// Runs one phase between phase_start/phase_end events. `fn` returns the
// payload merged into the phase_end event.
template <typename Fn>
void run_phase(const std::string &run_id, Phase phase, core::EventEmitter &emitter,
               std::ostream &log, MatchRunResult &result, Fn &&fn) {
  emitter.phase_start(run_id, phase, log);
  const auto t0 = Clock::now();
  core::json extra;
  try {
    extra = fn();
  } catch (const std::exception &e) {
    emitter.phase_end(run_id, phase, "error", {{"error", e.what()}}, log);
    throw;
  }
  const double dt = seconds_since(t0);
  result.phase_seconds[phase_to_string(phase)] = dt;
  extra["seconds"] = dt;
  emitter.phase_end(run_id, phase, "ok", extra, log);
}

} // namespace

correlation::CorrelationOptions make_correlation_options(const config::Config &cfg) {
  correlation::CorrelationOptions opts;
  opts.padding.round_to_even = cfg.padding.round_to_even;
  opts.padding.square = cfg.padding.square;
  opts.stddev_floor = cfg.stabilization.stddev_floor;
  opts.peak_tolerance = cfg.peak.tolerance();
  opts.parallel_terms = cfg.runtime.parallel_terms;
  return opts;
}

render::RenderOptions make_render_options(const config::Config &cfg) {
  render::RenderOptions opts;
  opts.clamp_negative = cfg.output.clamp_negative;
  opts.stretch = render::string_to_stretch_mode(cfg.output.stretch);
  opts.stretch_low_percentile = cfg.output.stretch_low_percentile;
  opts.stretch_high_percentile = cfg.output.stretch_high_percentile;
  opts.depth = cfg.output.surface_depth;
  opts.box_color = cfg.output.box_color;
  opts.box_thickness = cfg.output.box_thickness;
  opts.overlay_opacity = cfg.output.overlay_opacity;
  return opts;
}

MatchRunResult run_match_phases(const std::string &run_id, const config::Config &cfg,
                                const Raster &tmpl, const Raster &search,
                                core::EventEmitter &emitter, std::ostream &log) {
  const correlation::CorrelationOptions opts = make_correlation_options(cfg);
  MatchRunResult result;
  correlation::PaddedOperands ops;
  correlation::CorrelationTerms terms;

  run_phase(run_id, Phase::VALIDATE, emitter, log, result, [&]() {
    correlation::validate_inputs(tmpl, search);
    return core::json{
        {"template", {{"width", tmpl.width()}, {"height", tmpl.height()}}},
        {"search", {{"width", search.width()}, {"height", search.height()}}},
    };
  });

  run_phase(run_id, Phase::PAD_STATS, emitter, log, result, [&]() {
    ops = correlation::prepare_operands(tmpl, search, opts.padding);
    result.padded_size = ops.size;
    result.template_stats = ops.template_stats;
    result.search_stats = ops.search_stats;
    return core::json{
        {"padded_width", ops.size.width},
        {"padded_height", ops.size.height},
        {"template_mean", ops.template_stats.mean},
        {"template_std", ops.template_stats.stddev},
        {"search_mean", ops.search_stats.mean},
        {"search_std", ops.search_stats.stddev},
    };
  });

  if (ops.template_stats.stddev < opts.stddev_floor) {
    emitter.warning(run_id,
                    "template is near-constant (std below stddev_floor); "
                    "correlation surface is flattened",
                    log);
  }

  run_phase(run_id, Phase::CORRELATE, emitter, log, result, [&]() {
    terms = correlation::correlate_terms(ops, opts.parallel_terms);
    return core::json{{"parallel", opts.parallel_terms}};
  });

  run_phase(run_id, Phase::NORMALIZE, emitter, log, result, [&]() {
    result.surface = correlation::normalize_surface(terms, ops, opts.stddev_floor);
    terms = correlation::CorrelationTerms();
    return core::json{
        {"surface_width", result.surface.cols()},
        {"surface_height", result.surface.rows()},
        {"min", result.surface.scores().minCoeff()},
        {"max", result.surface.scores().maxCoeff()},
    };
  });

  run_phase(run_id, Phase::EXTRACT_PEAK, emitter, log, result, [&]() {
    result.match = correlation::find_peak(result.surface, opts.peak_tolerance);
    return core::json{
        {"row", result.match.row},
        {"col", result.match.col},
        {"score", result.match.score},
    };
  });

  return result;
}

} // namespace normxcorr::pipeline
