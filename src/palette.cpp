#include <ps2tex/palette.hpp>

#include <utility>

namespace ps2tex {

namespace {

// Entry positions within a 32-entry CLUT block
constexpr std::size_t CLUT_BLOCK_ENTRIES = 0x20;
constexpr std::size_t CLUT_SWAP_BEGIN = 0x10;
constexpr std::size_t CLUT_SWAP_END = 0x18;
constexpr std::size_t CLUT_SWAP_DISTANCE = 0x08;

} // namespace

void ps2_unswizzle_palette(std::span<std::uint8_t> raw, std::size_t entry_stride) noexcept {
    if (entry_stride == 0) {
        return;
    }

    const std::size_t block = CLUT_BLOCK_ENTRIES * entry_stride;
    const std::size_t begin = CLUT_SWAP_BEGIN * entry_stride;
    const std::size_t end = CLUT_SWAP_END * entry_stride;
    const std::size_t distance = CLUT_SWAP_DISTANCE * entry_stride;

    for (std::size_t i = 0; i < raw.size(); ++i) {
        const std::size_t r = i % block;
        if (r >= begin && r < end) {
            std::swap(raw[i], raw[i - distance]);
        }
    }
}

decode_result extract_palette(std::span<const std::uint8_t> bytes,
                              palette& out,
                              std::size_t entry_stride,
                              std::size_t count) {
    if (entry_stride < 3) {
        return decode_result::failure(decode_error::invalid_format,
            "Palette entries need at least 3 bytes");
    }
    if (count == 0) {
        return decode_result::failure(decode_error::invalid_format, "Palette has no entries");
    }
    if (count > bytes.size() / entry_stride) {
        return decode_result::failure(decode_error::truncated_palette,
            "Palette needs " + std::to_string(count * entry_stride) + " bytes, " +
            std::to_string(bytes.size()) + " available");
    }

    palette pal(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto* quad = bytes.data() + i * entry_stride;
        pal[i] = {quad[0], quad[1], quad[2]};
    }

    out = std::move(pal);
    return decode_result::success();
}

std::vector<std::uint8_t> palette_to_rgb(const palette& pal) {
    std::vector<std::uint8_t> rgb;
    rgb.reserve(pal.size() * 3);
    for (const auto& entry : pal) {
        rgb.push_back(entry.r);
        rgb.push_back(entry.g);
        rgb.push_back(entry.b);
    }
    return rgb;
}

} // namespace ps2tex
