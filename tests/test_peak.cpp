#include "normxcorr/core/errors.hpp"
#include "normxcorr/correlation/peak.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace normxcorr;
using namespace normxcorr::correlation;

TEST_CASE("peak_finds_single_maximum") {
    Matrix2Dd m = Matrix2Dd::Constant(5, 6, 0.1);
    m(3, 2) = 0.9;
    MatchResult r = find_peak(CorrelationSurface(m), 1.0 / 65535.0);
    REQUIRE(r.row == 3);
    REQUIRE(r.col == 2);
    REQUIRE(r.score == Catch::Approx(0.9));
}

TEST_CASE("peak_ties_resolve_to_first_row_major_cell") {
    Matrix2Dd m = Matrix2Dd::Zero(4, 5);
    m(3, 0) = 0.8;
    m(1, 4) = 0.8;
    MatchResult r = find_peak(CorrelationSurface(m), 1.0 / 65535.0);
    REQUIRE(r.row == 1);
    REQUIRE(r.col == 4);
}

TEST_CASE("peak_within_tolerance_counts_as_tie") {
    Matrix2Dd m = Matrix2Dd::Zero(3, 3);
    m(0, 1) = 0.9999;
    m(2, 2) = 1.0;

    MatchResult loose = find_peak(CorrelationSurface(m), 1e-3);
    REQUIRE(loose.row == 0);
    REQUIRE(loose.col == 1);
    REQUIRE(loose.score == Catch::Approx(1.0));

    MatchResult strict = find_peak(CorrelationSurface(m), 0.0);
    REQUIRE(strict.row == 2);
    REQUIRE(strict.col == 2);
}

TEST_CASE("peak_skips_nan_cells") {
    Matrix2Dd m = Matrix2Dd::Zero(2, 2);
    m(0, 0) = std::numeric_limits<double>::quiet_NaN();
    m(1, 0) = 0.5;
    MatchResult r = find_peak(CorrelationSurface(m), 0.0);
    REQUIRE(r.row == 1);
    REQUIRE(r.col == 0);
}

TEST_CASE("peak_rejects_empty_surface") {
    REQUIRE_THROWS_AS(find_peak(CorrelationSurface(), 0.0), EmptyInputError);

    Matrix2Dd nan = Matrix2Dd::Constant(2, 2, std::numeric_limits<double>::quiet_NaN());
    REQUIRE_THROWS_AS(find_peak(CorrelationSurface(nan), 0.0), EmptyInputError);
}
