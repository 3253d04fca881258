#ifndef PS2TEX_TEXTURE_RECORD_HPP_
#define PS2TEX_TEXTURE_RECORD_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace ps2tex {

// ============================================================================
// Texture Record
// ============================================================================
//
// One texture located inside the input buffer. All offsets are absolute.
// Produced by a source's scan step; consumed by its decode step.

struct texture_record {
    std::string name;

    std::size_t name_offset = 0;     // marker position, or table entry for fixed headers
    std::size_t data_offset = 0;     // sentinel position, or start of the texture data block
    std::size_t end_offset = 0;      // first byte past the record

    std::uint32_t width = 0;
    std::uint32_t height = 0;

    std::size_t palette_offset = 0;
    std::size_t pixel_offset = 0;

    // Fixed-header table fields (zero for marker-scan records)
    std::uint32_t flags = 0;
    std::uint32_t index_field = 0;
};

} // namespace ps2tex

#endif // PS2TEX_TEXTURE_RECORD_HPP_
