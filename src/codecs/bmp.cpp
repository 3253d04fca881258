#include <ps2tex/codecs/bmp.hpp>
#include <ps2tex/file_io.hpp>
#include "../byte_io.hpp"
#include "../decode_helpers.hpp"

#include <limits>

namespace ps2tex {

namespace {

constexpr std::uint32_t BI_RGB = 0;

constexpr std::uint32_t BMP_FILE_HEADER_SIZE = 14;
constexpr std::uint32_t BMP_INFO_HEADER_SIZE = 40;  // BITMAPINFOHEADER
constexpr std::uint32_t BMP_COLOR_TABLE_ENTRIES = 256;

// 72 DPI
constexpr std::uint32_t BMP_PIXELS_PER_METER = 2835;

} // namespace

// ============================================================================
// BMP Encoder
// ============================================================================

std::vector<std::uint8_t> encode_bmp(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    const bool indexed = surf.format() == pixel_format::indexed8;
    const int bits_per_pixel = indexed ? 8 : 24;
    const std::size_t stride = row_stride_4byte(surf.width(), bits_per_pixel);
    const std::size_t image_size = stride * static_cast<std::size_t>(surf.height());
    const std::uint32_t color_table_size = indexed ? BMP_COLOR_TABLE_ENTRIES * 4 : 0;
    const std::uint32_t data_offset = BMP_FILE_HEADER_SIZE + BMP_INFO_HEADER_SIZE + color_table_size;

    if (image_size > std::numeric_limits<std::uint32_t>::max() - data_offset) {
        return {};
    }
    const auto file_size = static_cast<std::uint32_t>(data_offset + image_size);

    std::vector<std::uint8_t> out;
    out.reserve(file_size);

    // BITMAPFILEHEADER
    out.push_back('B');
    out.push_back('M');
    put_le32(out, file_size);
    put_le32(out, 0);  // reserved
    put_le32(out, data_offset);

    // BITMAPINFOHEADER
    put_le32(out, BMP_INFO_HEADER_SIZE);
    put_le32(out, static_cast<std::uint32_t>(surf.width()));
    put_le32(out, static_cast<std::uint32_t>(surf.height()));  // positive = bottom-up
    put_le16(out, 1);  // planes
    put_le16(out, static_cast<std::uint16_t>(bits_per_pixel));
    put_le32(out, BI_RGB);
    put_le32(out, static_cast<std::uint32_t>(image_size));
    put_le32(out, BMP_PIXELS_PER_METER);
    put_le32(out, BMP_PIXELS_PER_METER);
    put_le32(out, indexed ? BMP_COLOR_TABLE_ENTRIES : 0);
    put_le32(out, 0);  // all colors important

    // Color table: BGRA, unused entries black
    if (indexed) {
        const auto palette = surf.palette();
        for (std::size_t i = 0; i < BMP_COLOR_TABLE_ENTRIES; ++i) {
            const std::size_t p = i * 3;
            if (p + 2 < palette.size()) {
                out.push_back(palette[p + 2]);
                out.push_back(palette[p + 1]);
                out.push_back(palette[p + 0]);
            } else {
                out.insert(out.end(), 3, 0);
            }
            out.push_back(0);
        }
    }

    const std::size_t row_bytes = static_cast<std::size_t>(surf.width()) * bytes_per_pixel(surf.format());
    const std::size_t padding = stride - row_bytes;
    const auto pixels = surf.pixels();

    for (int y = surf.height() - 1; y >= 0; --y) {
        const auto* row = pixels.data() + static_cast<std::size_t>(y) * surf.pitch();
        if (indexed) {
            out.insert(out.end(), row, row + row_bytes);
        } else {
            // RGB -> BGR
            for (int x = 0; x < surf.width(); ++x) {
                const auto* px = row + static_cast<std::size_t>(x) * 3;
                out.push_back(px[2]);
                out.push_back(px[1]);
                out.push_back(px[0]);
            }
        }
        out.insert(out.end(), padding, 0);
    }

    return out;
}

decode_result save_bmp(const memory_surface& surf, const std::filesystem::path& path) {
    auto bmp_data = encode_bmp(surf);
    if (bmp_data.empty()) {
        return decode_result::failure(decode_error::internal_error,
            "BMP encoding failed for " + path.string());
    }
    return write_file(path, bmp_data);
}

} // namespace ps2tex
