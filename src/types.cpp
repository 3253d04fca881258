#include <ps2tex/types.hpp>

namespace ps2tex {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                       return "none";
        case decode_error::pattern_not_found:          return "pattern_not_found";
        case decode_error::truncated_header:           return "truncated_header";
        case decode_error::truncated_palette:          return "truncated_palette";
        case decode_error::truncated_pixel_data:       return "truncated_pixel_data";
        case decode_error::out_of_range:               return "out_of_range";
        case decode_error::palette_index_out_of_range: return "palette_index_out_of_range";
        case decode_error::dimensions_exceeded:        return "dimensions_exceeded";
        case decode_error::invalid_format:             return "invalid_format";
        case decode_error::io_error:                   return "io_error";
        case decode_error::internal_error:             return "internal_error";
    }
    return "unknown";
}

} // namespace ps2tex
