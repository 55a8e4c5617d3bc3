#include "normxcorr/core/errors.hpp"
#include "normxcorr/correlation/matcher.hpp"
#include "normxcorr/io/fits_io.hpp"
#include "normxcorr/io/image_io.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <opencv2/imgcodecs.hpp>

#include <filesystem>

using namespace normxcorr;
using namespace normxcorr::io;

TEST_CASE("gray_8bit_keeps_samples_and_full_scale") {
    cv::Mat img(2, 3, CV_8UC1, cv::Scalar(0));
    img.at<uint8_t>(1, 2) = 200;
    Raster r = raster_from_mat(img, ChannelReduction::REC709);
    REQUIRE(r.width() == 3);
    REQUIRE(r.height() == 2);
    REQUIRE(r.full_scale == Catch::Approx(255.0));
    REQUIRE(r.pixels(1, 2) == Catch::Approx(200.0));
}

TEST_CASE("depth_sets_full_scale") {
    REQUIRE(full_scale_for_depth(CV_8U) == Catch::Approx(255.0));
    REQUIRE(full_scale_for_depth(CV_16U) == Catch::Approx(65535.0));
    REQUIRE(full_scale_for_depth(CV_32F) == Catch::Approx(1.0));
    REQUIRE_THROWS_AS(full_scale_for_depth(CV_8S), IOError);

    cv::Mat img16(2, 2, CV_16UC1, cv::Scalar(1000));
    Raster r = raster_from_mat(img16, ChannelReduction::AVERAGE);
    REQUIRE(r.full_scale == Catch::Approx(65535.0));
}

TEST_CASE("colour_reduction_weights_channels") {
    cv::Mat red(1, 1, CV_8UC3, cv::Scalar(0, 0, 255)); // BGR
    REQUIRE(raster_from_mat(red, ChannelReduction::REC709).pixels(0, 0) ==
            Catch::Approx(0.2126 * 255.0).epsilon(1e-4));
    REQUIRE(raster_from_mat(red, ChannelReduction::REC601).pixels(0, 0) ==
            Catch::Approx(0.299 * 255.0).epsilon(1e-4));
    REQUIRE(raster_from_mat(red, ChannelReduction::AVERAGE).pixels(0, 0) ==
            Catch::Approx(85.0).epsilon(1e-4));
}

TEST_CASE("alpha_channel_is_ignored") {
    cv::Mat bgra(1, 1, CV_8UC4, cv::Scalar(100, 100, 100, 0));
    Raster r = raster_from_mat(bgra, ChannelReduction::REC709);
    REQUIRE(r.pixels(0, 0) == Catch::Approx(100.0).epsilon(1e-4));
}

TEST_CASE("channel_reduction_parsing") {
    REQUIRE(string_to_channel_reduction("Rec601") == ChannelReduction::REC601);
    REQUIRE(channel_reduction_to_string(ChannelReduction::AVERAGE) == "average");
    REQUIRE_THROWS_AS(string_to_channel_reduction("luma"), ValidationError);
}

TEST_CASE("fits_extension_detection") {
    REQUIRE(is_fits_image_path("frame.FITS"));
    REQUIRE(is_fits_image_path("frame.fit"));
    REQUIRE(is_fits_image_path("frame.fits.fz"));
    REQUIRE_FALSE(is_fits_image_path("frame.png"));
}

TEST_CASE("load_raster_reads_png_and_reports_missing_file") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "normxcorr_test_image_io";
    fs::create_directories(dir);
    const fs::path png = dir / "gray.png";

    cv::Mat img(4, 5, CV_16UC1, cv::Scalar(4096));
    REQUIRE(cv::imwrite(png.string(), img));

    Raster r = load_raster(png, ChannelReduction::REC709, 65535.0f);
    REQUIRE(r.width() == 5);
    REQUIRE(r.height() == 4);
    REQUIRE(r.full_scale == Catch::Approx(65535.0));
    REQUIRE(r.pixels(3, 4) == Catch::Approx(4096.0));

    REQUIRE_THROWS_AS(load_raster(dir / "missing.png", ChannelReduction::REC709, 65535.0f),
                      IOError);
    fs::remove_all(dir);
}

TEST_CASE("fits_roundtrip_carries_header_cards") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "normxcorr_test_fits_io";
    fs::create_directories(dir);
    const fs::path path = dir / "surface.fits";

    Matrix2Df data = Matrix2Df::Zero(3, 4);
    data(2, 1) = 0.75f;
    FitsHeader hdr;
    hdr.set("PEAKX", 1);
    hdr.set("PEAKVAL", 0.75);
    write_fits_float(path, data, hdr);

    auto [back, back_hdr] = read_fits_float(path);
    REQUIRE(back.rows() == 3);
    REQUIRE(back.cols() == 4);
    REQUIRE(back(2, 1) == Catch::Approx(0.75));
    REQUIRE(back_hdr.get_int("PEAKX").value_or(-1) == 1);
    REQUIRE(back_hdr.get_double("PEAKVAL").value_or(0.0) == Catch::Approx(0.75));
    REQUIRE_FALSE(back_hdr.get_string("CREATOR").has_value());
    fs::remove_all(dir);
}

TEST_CASE("fits_image_type_sets_full_scale") {
    REQUIRE(full_scale_for_image_type(8) == Catch::Approx(255.0));
    REQUIRE(full_scale_for_image_type(16) == Catch::Approx(32767.0));
    REQUIRE(full_scale_for_image_type(20) == Catch::Approx(65535.0));
    REQUIRE(full_scale_for_image_type(-32) == Catch::Approx(1.0));
    REQUIRE(full_scale_for_image_type(-64) == Catch::Approx(1.0));
    REQUIRE_THROWS_AS(full_scale_for_image_type(7), FitsError);
}

TEST_CASE("load_raster_derives_fits_full_scale_from_bitpix") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "normxcorr_test_fits_scale";
    fs::create_directories(dir);

    Raster bytes = test::random_raster(12, 10, 41, 255.0f);
    bytes.pixels = bytes.pixels.array().round().matrix();
    const fs::path p8 = dir / "bytes.fits";
    write_fits_image(p8, bytes.pixels, FitsHeader(), 8);

    Raster r8 = load_raster(p8, ChannelReduction::REC709, 0.0f);
    REQUIRE(r8.full_scale == Catch::Approx(255.0));
    REQUIRE(r8.pixels(9, 11) == Catch::Approx(bytes.pixels(9, 11)));

    const fs::path p16 = dir / "ushort.fits";
    write_fits_image(p16, Matrix2Df::Constant(4, 4, 40000.0f), FitsHeader(), 20);
    Raster r16 = load_raster(p16, ChannelReduction::REC709, 0.0f);
    REQUIRE(r16.full_scale == Catch::Approx(65535.0));
    REQUIRE(r16.pixels(0, 0) == Catch::Approx(40000.0));

    Raster unit = test::random_raster(12, 10, 42, 1.0f);
    const fs::path pf = dir / "unit.fits";
    write_fits_float(pf, unit.pixels, FitsHeader());
    Raster rf = load_raster(pf, ChannelReduction::REC709, 0.0f);
    REQUIRE(rf.full_scale == Catch::Approx(1.0));

    // a positive configured value overrides the stored type
    Raster forced = load_raster(p8, ChannelReduction::REC709, 1000.0f);
    REQUIRE(forced.full_scale == Catch::Approx(1000.0));
    fs::remove_all(dir);
}

TEST_CASE("low_range_fits_inputs_match_at_true_offset") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "normxcorr_test_fits_match";
    fs::create_directories(dir);

    // 8-bit samples and [0,1] float samples both sit far below 65535
    Raster bytes = test::random_raster(40, 40, 43, 255.0f);
    bytes.pixels = bytes.pixels.array().round().matrix();
    Raster unit = test::random_raster(40, 40, 44, 1.0f);

    struct Case {
        Raster search;
        int image_type;
    };
    for (const Case& c : {Case{bytes, 8}, Case{unit, -32}}) {
        const fs::path search_path = dir / "search.fits";
        const fs::path tmpl_path = dir / "template.fits";
        write_fits_image(search_path, c.search.pixels, FitsHeader(), c.image_type);
        write_fits_image(tmpl_path, c.search.pixels.block(17, 23, 8, 8), FitsHeader(),
                         c.image_type);

        const Raster search = load_raster(search_path, ChannelReduction::REC709, 0.0f);
        const Raster tmpl = load_raster(tmpl_path, ChannelReduction::REC709, 0.0f);
        const auto out = correlation::match_template(tmpl, search);
        REQUIRE(out.match.col == 23);
        REQUIRE(out.match.row == 17);
        REQUIRE(out.match.score == Catch::Approx(1.0).margin(1e-5));
    }
    fs::remove_all(dir);
}
