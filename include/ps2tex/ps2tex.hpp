#ifndef PS2TEX_PS2TEX_HPP_
#define PS2TEX_PS2TEX_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>
#include <ps2tex/texture_record.hpp>
#include <ps2tex/byte_scanner.hpp>
#include <ps2tex/header_parser.hpp>
#include <ps2tex/palette.hpp>
#include <ps2tex/pixel_decoder.hpp>
#include <ps2tex/image_assembler.hpp>
#include <ps2tex/file_io.hpp>
#include <ps2tex/source.hpp>
#include <ps2tex/session.hpp>
#include <ps2tex/sources/marker_scan.hpp>
#include <ps2tex/sources/studio_model.hpp>
#include <ps2tex/codecs/bmp.hpp>
#include <ps2tex/codecs/png.hpp>

namespace ps2tex {

// All public API is included via the headers above.
// See:
//   - types.hpp:           pixel_format, decode_error, decode_result, decode_options
//   - surface.hpp:         surface interface, memory_surface
//   - byte_scanner.hpp:    marker search, name extraction, record enumeration
//   - header_parser.hpp:   field layouts, StudioModel header and texture table
//   - palette.hpp:         CLUT extraction and GS swizzle correction
//   - pixel_decoder.hpp:   index_grid, decode_indices()
//   - image_assembler.hpp: assemble(), flatten(), quantize_adaptive()
//   - source.hpp:          texture_source, source_registry
//   - session.hpp:         session, export_report
//   - codecs/*.hpp:        BMP and PNG writers

} // namespace ps2tex

#endif // PS2TEX_PS2TEX_HPP_
