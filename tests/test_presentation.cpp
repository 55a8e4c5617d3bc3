#include "normxcorr/core/errors.hpp"
#include "normxcorr/render/presentation.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace normxcorr;
using namespace normxcorr::render;

TEST_CASE("display_clamps_negative_scores") {
    Matrix2Dd m(2, 2);
    m << -0.5, 0.25,
          1.0, 0.0;
    CorrelationSurface s(m);

    RenderOptions opts;
    Matrix2Dd d = to_display(s, opts);
    REQUIRE(d(0, 0) == Catch::Approx(0.0));
    REQUIRE(d(0, 1) == Catch::Approx(0.25));
    REQUIRE(d(1, 0) == Catch::Approx(1.0));

    // the surface itself is untouched
    REQUIRE(s.at(0, 0) == Catch::Approx(-0.5));
}

TEST_CASE("display_maps_signed_range_when_not_clamping") {
    Matrix2Dd m(1, 3);
    m << -1.0, 0.0, 1.0;
    RenderOptions opts;
    opts.clamp_negative = false;
    Matrix2Dd d = to_display(CorrelationSurface(m), opts);
    REQUIRE(d(0, 0) == Catch::Approx(0.0));
    REQUIRE(d(0, 1) == Catch::Approx(0.5));
    REQUIRE(d(0, 2) == Catch::Approx(1.0));
}

TEST_CASE("minmax_stretch_spans_unit_interval") {
    Matrix2Dd m(2, 2);
    m << 0.2, 0.4,
         0.6, 0.8;
    RenderOptions opts;
    opts.stretch = StretchMode::MINMAX;
    Matrix2Dd d = to_display(CorrelationSurface(m), opts);
    REQUIRE(d(0, 0) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(d(0, 1) == Catch::Approx(1.0 / 3.0));
    REQUIRE(d(1, 0) == Catch::Approx(2.0 / 3.0));
    REQUIRE(d(1, 1) == Catch::Approx(1.0));
}

TEST_CASE("encode_display_scales_to_integer_depth") {
    Matrix2Dd d(1, 2);
    d << 0.0, 1.0;

    cv::Mat e8 = encode_display(d, 8);
    REQUIRE(e8.type() == CV_8UC1);
    REQUIRE(e8.at<uint8_t>(0, 0) == 0);
    REQUIRE(e8.at<uint8_t>(0, 1) == 255);

    cv::Mat e16 = encode_display(d, 16);
    REQUIRE(e16.type() == CV_16UC1);
    REQUIRE(e16.at<uint16_t>(0, 1) == 65535);

    REQUIRE_THROWS_AS(encode_display(d, 12), ValidationError);
}

TEST_CASE("match_box_outlines_template_footprint") {
    Raster search = test::constant_raster(20, 20, 0.0f);
    MatchResult match;
    match.row = 5;
    match.col = 4;

    RenderOptions opts;
    cv::Mat img = draw_match_box(search, match, 6, 3, opts);
    REQUIRE(img.type() == CV_8UC3);

    const cv::Vec3b corner = img.at<cv::Vec3b>(5, 4);
    REQUIRE(corner[0] == 0);
    REQUIRE(corner[1] == 0);
    REQUIRE(corner[2] == 255);

    const cv::Vec3b far_corner = img.at<cv::Vec3b>(7, 9);
    REQUIRE(far_corner[2] == 255);

    const cv::Vec3b inside = img.at<cv::Vec3b>(6, 6);
    REQUIRE(inside[2] == 0);
    const cv::Vec3b outside = img.at<cv::Vec3b>(8, 10);
    REQUIRE(outside[2] == 0);
}

TEST_CASE("overlay_blends_template_over_match") {
    Raster search = test::constant_raster(10, 10, 0.0f);
    Raster tmpl = test::constant_raster(3, 3, 255.0f);
    MatchResult match;
    match.row = 2;
    match.col = 8;

    RenderOptions opts;
    opts.overlay_opacity = 0.5;
    cv::Mat img = overlay_template(search, tmpl, match, opts);

    const cv::Vec3b blended = img.at<cv::Vec3b>(3, 9);
    REQUIRE(blended[0] >= 127);
    REQUIRE(blended[0] <= 128);
    REQUIRE(img.at<cv::Vec3b>(3, 7)[0] == 0);
}

TEST_CASE("match_line_reports_column_then_row") {
    MatchResult m;
    m.row = 17;
    m.col = 23;
    m.score = 0.5;
    REQUIRE(format_match_line(m) == "Match Coords: (23,17) And Score In Range 0 to 1: (0.5)");
}

TEST_CASE("stretch_mode_parsing") {
    REQUIRE(string_to_stretch_mode("MinMax") == StretchMode::MINMAX);
    REQUIRE(string_to_stretch_mode("percentile") == StretchMode::PERCENTILE);
    REQUIRE_THROWS_AS(string_to_stretch_mode("log"), ValidationError);
}
