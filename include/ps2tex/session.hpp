#ifndef PS2TEX_SESSION_HPP_
#define PS2TEX_SESSION_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>
#include <ps2tex/header_parser.hpp>
#include <ps2tex/source.hpp>
#include <ps2tex/texture_record.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ps2tex {

// ============================================================================
// Per-Record Outcomes
// ============================================================================

struct record_outcome {
    std::size_t index = 0;
    std::string name;
    std::size_t offset = 0;
    decode_result result;
    std::filesystem::path path;  // output file, set on success
};

struct export_report {
    std::vector<record_outcome> outcomes;

    [[nodiscard]] std::size_t saved_count() const noexcept;
    [[nodiscard]] std::size_t failed_count() const noexcept;
    [[nodiscard]] bool all_saved() const noexcept { return failed_count() == 0; }
};

// ============================================================================
// Session
// ============================================================================

/**
 * One opened file and the textures found in it.
 *
 * Holds the file bytes, the source that recognized them and the record list.
 * Decoding is on demand and does not mutate the session, so records may be
 * decoded in any order.
 */
class PS2TEX_EXPORT session {
public:
    session() = default;

    /**
     * Read a file and list its textures.
     * @param path Input file
     * @param options Decode options kept for later decodes
     * @param source_name Source to use; empty to sniff
     * @return io_error, invalid_format when no source recognizes the data,
     *         pattern_not_found when the source finds no textures
     */
    [[nodiscard]] decode_result load(const std::filesystem::path& path,
                                     const decode_options& options = {},
                                     std::string_view source_name = {});

    // Same as load(path) for bytes already in memory
    [[nodiscard]] decode_result load(std::vector<std::uint8_t> data,
                                     const decode_options& options = {},
                                     std::string_view source_name = {});

    [[nodiscard]] bool loaded() const noexcept { return source_ != nullptr; }
    [[nodiscard]] const texture_source* source() const noexcept { return source_; }
    [[nodiscard]] const parsed_header& header() const noexcept { return header_; }
    [[nodiscard]] const std::vector<texture_record>& textures() const noexcept { return records_; }
    [[nodiscard]] const decode_options& options() const noexcept { return options_; }
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return data_; }

    /**
     * Decode one texture as an indexed8 image.
     * @return out_of_range for a bad index, otherwise the record's decode result
     */
    [[nodiscard]] decode_result get_image(std::size_t index, surface& surf) const;

    // Decode one texture and flatten it to rgb888 for display
    [[nodiscard]] decode_result get_flattened(std::size_t index, surface& surf) const;

    // File name the texture is exported under, including extension
    [[nodiscard]] std::string export_name(std::size_t index, export_format format) const;

    /**
     * Decode one texture and write it to a file.
     * @param index Texture index
     * @param path Output file
     * @param format BMP or 8-bit PNG
     */
    [[nodiscard]] record_outcome save_one(std::size_t index,
                                          const std::filesystem::path& path,
                                          export_format format) const;

    /**
     * Export every texture into a directory under its export name.
     * A failing texture is reported and the rest are still written.
     */
    [[nodiscard]] export_report save_all(const std::filesystem::path& directory,
                                         export_format format) const;

    // save_all in the source's default format
    [[nodiscard]] export_report save_all(const std::filesystem::path& directory) const;

private:
    void reset() noexcept;

    std::vector<std::uint8_t> data_;
    decode_options options_;
    const texture_source* source_ = nullptr;
    parsed_header header_;
    std::vector<texture_record> records_;
};

} // namespace ps2tex

#endif // PS2TEX_SESSION_HPP_
