#include <ps2tex/codecs/png.hpp>
#include <ps2tex/file_io.hpp>
#include <ps2tex/image_assembler.hpp>
#include <lodepng.h>

namespace ps2tex {

// ============================================================================
// PNG Encoder
// ============================================================================

std::vector<std::uint8_t> encode_png(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    const auto w = static_cast<unsigned>(surf.width());
    const auto h = static_cast<unsigned>(surf.height());
    std::vector<std::uint8_t> png_data;

    switch (surf.format()) {
        case pixel_format::rgb888: {
            unsigned error = lodepng::encode(png_data, surf.pixels().data(), w, h, LCT_RGB, 8);
            if (error) {
                return {};
            }
            break;
        }
        case pixel_format::indexed8: {
            const auto palette = surf.palette();
            if (palette.empty()) {
                return {};
            }

            lodepng::State state;
            state.info_raw.colortype = LCT_PALETTE;
            state.info_raw.bitdepth = 8;
            state.info_png.color.colortype = LCT_PALETTE;
            state.info_png.color.bitdepth = 8;
            // Keep the palette and index order as decoded
            state.encoder.auto_convert = 0;

            for (std::size_t i = 0; i + 2 < palette.size(); i += 3) {
                if (lodepng_palette_add(&state.info_png.color, palette[i], palette[i + 1], palette[i + 2], 255) ||
                    lodepng_palette_add(&state.info_raw, palette[i], palette[i + 1], palette[i + 2], 255)) {
                    return {};
                }
            }

            unsigned error = lodepng::encode(png_data, surf.pixels().data(), w, h, state);
            if (error) {
                return {};
            }
            break;
        }
    }

    return png_data;
}

std::vector<std::uint8_t> encode_png8(const memory_surface& surf) {
    if (surf.format() == pixel_format::indexed8) {
        return encode_png(surf);
    }

    memory_surface quantized;
    if (!quantize_adaptive(surf, quantized)) {
        return {};
    }
    return encode_png(quantized);
}

decode_result save_png(const memory_surface& surf, const std::filesystem::path& path) {
    auto png_data = encode_png(surf);
    if (png_data.empty()) {
        return decode_result::failure(decode_error::internal_error,
            "PNG encoding failed for " + path.string());
    }
    return write_file(path, png_data);
}

decode_result save_png8(const memory_surface& surf, const std::filesystem::path& path) {
    auto png_data = encode_png8(surf);
    if (png_data.empty()) {
        return decode_result::failure(decode_error::internal_error,
            "PNG encoding failed for " + path.string());
    }
    return write_file(path, png_data);
}

} // namespace ps2tex
