#include <catch2/catch_test_macros.hpp>
#include "classifier/image_header.hpp"
#include "image_fixtures.hpp"

using namespace clipstash;
using namespace clipstash::testing;

TEST_CASE("ImageHeaderParser detects formats from magic bytes", "[image]") {
    CHECK(ImageHeaderParser::detect_format(make_png(1, 1)) == ImageFormat::PNG);
    CHECK(ImageHeaderParser::detect_format(make_jpeg(1, 1)) == ImageFormat::JPEG);
    CHECK(ImageHeaderParser::detect_format(make_gif(1, 1)) == ImageFormat::GIF);
    CHECK(ImageHeaderParser::detect_format(make_bmp(1, 1)) == ImageFormat::BMP);

    const std::vector<uint8_t> junk = {'h', 'e', 'l', 'l', 'o'};
    CHECK(ImageHeaderParser::detect_format(junk) == ImageFormat::UNKNOWN);
    CHECK(ImageHeaderParser::detect_format({}) == ImageFormat::UNKNOWN);
}

TEST_CASE("ImageHeaderParser reads dimensions", "[image]") {
    SECTION("PNG") {
        auto dims = ImageHeaderParser::parse(make_png(1920, 1080));
        REQUIRE(dims.has_value());
        CHECK(dims->format == ImageFormat::PNG);
        CHECK(dims->width == 1920);
        CHECK(dims->height == 1080);
    }

    SECTION("GIF") {
        auto dims = ImageHeaderParser::parse(make_gif(320, 200));
        REQUIRE(dims.has_value());
        CHECK(dims->width == 320);
        CHECK(dims->height == 200);
    }

    SECTION("JPEG skips non-frame segments") {
        auto dims = ImageHeaderParser::parse(make_jpeg(640, 480));
        REQUIRE(dims.has_value());
        CHECK(dims->format == ImageFormat::JPEG);
        CHECK(dims->width == 640);
        CHECK(dims->height == 480);
    }

    SECTION("BMP top-down has negative height") {
        auto dims = ImageHeaderParser::parse(make_bmp(100, -50));
        REQUIRE(dims.has_value());
        CHECK(dims->width == 100);
        CHECK(dims->height == 50);
    }

    SECTION("TIFF little-endian with SHORT tags") {
        const std::vector<uint8_t> tiff = {
            'I', 'I', 42, 0, 8, 0, 0, 0,        // header, IFD at 8
            2, 0,                               // 2 entries
            0x00, 0x01, 3, 0, 1, 0, 0, 0, 0x20, 0x00, 0, 0,   // width = 32
            0x01, 0x01, 3, 0, 1, 0, 0, 0, 0x10, 0x00, 0, 0,   // length = 16
            0, 0, 0, 0
        };
        auto dims = ImageHeaderParser::parse(tiff);
        REQUIRE(dims.has_value());
        CHECK(dims->format == ImageFormat::TIFF);
        CHECK(dims->width == 32);
        CHECK(dims->height == 16);
    }
}

TEST_CASE("ImageHeaderParser rejects malformed headers", "[image]") {
    SECTION("Truncated PNG") {
        auto png = make_png(10, 10);
        png.resize(20);
        CHECK_FALSE(ImageHeaderParser::parse(png).has_value());
    }

    SECTION("Zero dimension") {
        CHECK_FALSE(ImageHeaderParser::parse(make_png(0, 10)).has_value());
    }

    SECTION("JPEG with scan data before any frame header") {
        const std::vector<uint8_t> jpeg = {0xFF, 0xD8, 0xFF, 0xDA, 0x00, 0x08};
        CHECK_FALSE(ImageHeaderParser::parse(jpeg).has_value());
    }

    SECTION("Unknown bytes") {
        const std::vector<uint8_t> junk(64, 0x42);
        CHECK_FALSE(ImageHeaderParser::parse(junk).has_value());
    }
}
