#include "normxcorr/core/errors.hpp"
#include "normxcorr/pipeline/match_runner.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace normxcorr;
using namespace normxcorr::pipeline;

namespace {

std::vector<core::json> parse_lines(const std::string& text) {
    std::vector<core::json> events;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) events.push_back(core::json::parse(line));
    }
    return events;
}

} // namespace

TEST_CASE("runner_emits_phase_events_and_finds_match") {
    Raster search = test::random_raster(64, 48, 31);
    Raster tmpl = test::crop_raster(search, 20, 10, 12, 8);

    config::Config cfg;
    core::EventEmitter emitter;
    std::ostringstream log;
    MatchRunResult result = run_match_phases("run-1", cfg, tmpl, search, emitter, log);

    REQUIRE(result.match.col == 20);
    REQUIRE(result.match.row == 10);
    REQUIRE(result.match.score == Catch::Approx(1.0).margin(1e-6));
    REQUIRE(result.padded_size.width == 64);
    REQUIRE(result.padded_size.height == 64);
    REQUIRE(result.phase_seconds.contains("CORRELATE"));

    auto events = parse_lines(log.str());
    std::vector<std::string> ended;
    for (const auto& ev : events) {
        REQUIRE(ev["run_id"] == "run-1");
        if (ev["type"] == "phase_end") {
            REQUIRE(ev["status"] == "ok");
            ended.push_back(ev["phase_name"].get<std::string>());
        }
    }
    REQUIRE(ended == std::vector<std::string>{"VALIDATE", "PAD_STATS", "CORRELATE",
                                              "NORMALIZE", "EXTRACT_PEAK"});
    REQUIRE(events.back()["col"] == 20);
    REQUIRE(events.back()["row"] == 10);
}

TEST_CASE("runner_reports_failing_phase") {
    Raster search = test::random_raster(8, 8, 32);
    Raster tmpl = test::random_raster(9, 9, 33);

    config::Config cfg;
    core::EventEmitter emitter;
    std::ostringstream log;
    REQUIRE_THROWS_AS(run_match_phases("run-2", cfg, tmpl, search, emitter, log),
                      DimensionError);

    auto events = parse_lines(log.str());
    REQUIRE(events.size() == 2);
    REQUIRE(events[1]["type"] == "phase_end");
    REQUIRE(events[1]["phase_name"] == "VALIDATE");
    REQUIRE(events[1]["status"] == "error");
}

TEST_CASE("runner_warns_on_flat_template") {
    Raster search = test::random_raster(16, 16, 34);
    Raster tmpl = test::constant_raster(4, 4, 50.0f);

    config::Config cfg;
    core::EventEmitter emitter;
    std::ostringstream log;
    run_match_phases("run-3", cfg, tmpl, search, emitter, log);

    bool warned = false;
    for (const auto& ev : parse_lines(log.str())) {
        if (ev["type"] == "warning") warned = true;
    }
    REQUIRE(warned);
}

TEST_CASE("config_maps_to_correlation_and_render_options") {
    config::Config cfg;
    cfg.padding.square = false;
    cfg.stabilization.stddev_floor = 0.01;
    cfg.peak.quantum_levels = 255;
    cfg.runtime.parallel_terms = false;
    cfg.output.stretch = "percentile";
    cfg.output.surface_depth = 16;

    auto c = make_correlation_options(cfg);
    REQUIRE_FALSE(c.padding.square);
    REQUIRE(c.stddev_floor == Catch::Approx(0.01));
    REQUIRE(c.peak_tolerance == Catch::Approx(1.0 / 255.0));
    REQUIRE_FALSE(c.parallel_terms);

    auto r = make_render_options(cfg);
    REQUIRE(r.stretch == render::StretchMode::PERCENTILE);
    REQUIRE(r.depth == 16);
}
