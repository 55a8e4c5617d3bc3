#pragma once

#include "normxcorr/config/configuration.hpp"
#include "normxcorr/core/events.hpp"
#include "normxcorr/core/types.hpp"
#include "normxcorr/correlation/matcher.hpp"
#include "normxcorr/render/presentation.hpp"

#include <ostream>
#include <string>

namespace normxcorr::pipeline {

struct MatchRunResult {
  CorrelationSurface surface;
  MatchResult match;
  PaddedSize padded_size;
  Statistics template_stats;
  Statistics search_stats;
  core::json phase_seconds = core::json::object();
};

correlation::CorrelationOptions make_correlation_options(const config::Config &cfg);

render::RenderOptions make_render_options(const config::Config &cfg);

// Runs VALIDATE .. EXTRACT_PEAK on in-memory rasters, emitting phase events
// to `log`. A failing phase is logged with status "error" and rethrown.
MatchRunResult run_match_phases(const std::string &run_id, const config::Config &cfg,
                                const Raster &tmpl, const Raster &search,
                                core::EventEmitter &emitter, std::ostream &log);

} // namespace normxcorr::pipeline
