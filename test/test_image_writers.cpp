#include <doctest/doctest.h>
#include <ps2tex/ps2tex.hpp>

#include "helpers/image_readers.hpp"
#include "helpers/synthetic.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace {

std::uint32_t le32_at(const std::vector<std::uint8_t>& buf, std::size_t at) {
    return static_cast<std::uint32_t>(buf[at]) |
           (static_cast<std::uint32_t>(buf[at + 1]) << 8) |
           (static_cast<std::uint32_t>(buf[at + 2]) << 16) |
           (static_cast<std::uint32_t>(buf[at + 3]) << 24);
}

// 3x2 indexed surface: indices 0..5, palette entry i = (10i, 20i, 30i)
ps2tex::memory_surface small_indexed() {
    ps2tex::palette pal(6);
    for (std::size_t i = 0; i < pal.size(); ++i) {
        pal[i] = {static_cast<std::uint8_t>(10 * i),
                  static_cast<std::uint8_t>(20 * i),
                  static_cast<std::uint8_t>(30 * i)};
    }
    ps2tex::memory_surface surf;
    REQUIRE(ps2tex::assemble(ps2tex::index_grid(3, 2, {0, 1, 2, 3, 4, 5}), pal, surf).ok);
    return surf;
}

} // namespace

TEST_CASE("BMP writer") {
    SUBCASE("Indexed layout") {
        const auto bmp = ps2tex::encode_bmp(small_indexed());
        REQUIRE(bmp.size() == 14 + 40 + 1024 + 4 * 2);
        CHECK(bmp[0] == 'B');
        CHECK(bmp[1] == 'M');
        CHECK(le32_at(bmp, 2) == bmp.size());
        CHECK(le32_at(bmp, 10) == 1078);
        CHECK(le32_at(bmp, 18) == 3);
        CHECK(le32_at(bmp, 22) == 2);
        CHECK(bmp[28] == 8);
        CHECK(le32_at(bmp, 46) == 256);

        // Color table is BGRA
        CHECK(bmp[54 + 4 * 2 + 0] == 60);
        CHECK(bmp[54 + 4 * 2 + 1] == 40);
        CHECK(bmp[54 + 4 * 2 + 2] == 20);
        CHECK(bmp[54 + 4 * 6] == 0);

        // Bottom row first, padded to four bytes
        CHECK(bmp[1078 + 0] == 3);
        CHECK(bmp[1078 + 2] == 5);
        CHECK(bmp[1078 + 3] == 0);
        CHECK(bmp[1082 + 0] == 0);
        CHECK(bmp[1082 + 1] == 1);
    }

    SUBCASE("Decodes to the palette colors") {
        const auto image = test_data::read_bmp(ps2tex::encode_bmp(small_indexed()));
        REQUIRE(image.width == 3);
        REQUIRE(image.height == 2);
        CHECK(image.at(2, 1)[0] == 50);
        CHECK(image.at(2, 1)[1] == 100);
        CHECK(image.at(2, 1)[2] == 150);
        CHECK(image.at(0, 0)[0] == 0);
    }

    SUBCASE("24-bit output for RGB surfaces") {
        ps2tex::memory_surface rgb;
        REQUIRE(ps2tex::flatten(small_indexed(), rgb).ok);
        const auto bmp = ps2tex::encode_bmp(rgb);
        CHECK(bmp[28] == 24);
        CHECK(le32_at(bmp, 10) == 54);

        const auto image = test_data::read_bmp(bmp);
        REQUIRE(image.width == 3);
        CHECK(image.at(1, 0)[0] == 10);
        CHECK(image.at(1, 0)[2] == 30);
    }

    SUBCASE("Empty surface") {
        ps2tex::memory_surface empty;
        CHECK(ps2tex::encode_bmp(empty).empty());
    }
}

TEST_CASE("PNG writer") {
    SUBCASE("Indexed surfaces keep their palette") {
        const auto png = test_data::read_png(ps2tex::encode_png(small_indexed()));
        REQUIRE(png.image.width == 3);
        CHECK(png.palette_color_type);
        CHECK(png.bit_depth == 8);
        CHECK(png.palette_size == 6);
        CHECK(png.image.at(1, 1)[1] == 80);
    }

    SUBCASE("RGB surfaces are written truecolor") {
        ps2tex::memory_surface rgb;
        REQUIRE(ps2tex::flatten(small_indexed(), rgb).ok);
        const auto png = test_data::read_png(ps2tex::encode_png(rgb));
        REQUIRE(png.image.width == 3);
        CHECK_FALSE(png.palette_color_type);
        CHECK(png.image.at(2, 0)[2] == 60);
    }

    SUBCASE("png8 quantizes RGB to a palette") {
        ps2tex::memory_surface rgb;
        REQUIRE(ps2tex::flatten(small_indexed(), rgb).ok);
        const auto png = test_data::read_png(ps2tex::encode_png8(rgb));
        REQUIRE(png.image.height == 2);
        CHECK(png.palette_color_type);
        CHECK(png.palette_size == 6);
        CHECK(png.image.at(0, 1)[0] == 30);
    }

    SUBCASE("Files on disk") {
        test_data::scoped_temp_dir dir;
        const auto path = dir.path() / "t.png";
        CHECK(ps2tex::save_png(small_indexed(), path).ok);
        CHECK(test_data::read_png(test_data::read_bytes(path)).image.width == 3);
    }

    SUBCASE("Write failures name the path") {
        test_data::scoped_temp_dir dir;
        const auto missing = dir.path() / "no" / "such" / "t.bmp";
        const auto result = ps2tex::save_bmp(small_indexed(), missing);
        CHECK_FALSE(result.ok);
        CHECK(result.error == ps2tex::decode_error::io_error);
        CHECK(result.message.find(missing.string()) != std::string::npos);

        const auto png_result = ps2tex::save_png8(small_indexed(), dir.path() / "no" / "t.png");
        CHECK(png_result.error == ps2tex::decode_error::io_error);
    }

    SUBCASE("Empty surfaces are not written") {
        test_data::scoped_temp_dir dir;
        ps2tex::memory_surface empty;
        const auto path = dir.path() / "empty.png";
        CHECK(ps2tex::save_png(empty, path).error == ps2tex::decode_error::internal_error);
        CHECK_FALSE(std::filesystem::exists(path));
    }
}
