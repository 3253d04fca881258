#include <ps2tex/pixel_decoder.hpp>

#include <string>

namespace ps2tex {

decode_result decode_indices(std::span<const std::uint8_t> bytes,
                             int width,
                             int height,
                             index_grid& out) {
    if (width <= 0 || height <= 0) {
        return decode_result::failure(decode_error::out_of_range,
            "Invalid index grid size " + std::to_string(width) + "x" + std::to_string(height));
    }

    const std::size_t needed = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    if (bytes.size() < needed) {
        return decode_result::failure(decode_error::truncated_pixel_data,
            "Pixel data needs " + std::to_string(needed) + " bytes, " +
            std::to_string(bytes.size()) + " available");
    }

    out = index_grid(width, height,
                     std::vector<std::uint8_t>(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(needed)));
    return decode_result::success();
}

} // namespace ps2tex
