#ifndef PS2TEX_SOURCE_HPP_
#define PS2TEX_SOURCE_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>
#include <ps2tex/surface.hpp>
#include <ps2tex/header_parser.hpp>
#include <ps2tex/texture_record.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ps2tex {

enum class export_format {
    bmp,   // 8-bit indexed BMP
    png8   // 8-bit palette PNG, re-quantized
};

// ============================================================================
// Texture Source Interface
// ============================================================================

/**
 * Abstract base class for texture container formats.
 * Used by the source registry for runtime polymorphism.
 */
class PS2TEX_EXPORT texture_source {
public:
    virtual ~texture_source() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> extensions() const noexcept = 0;
    [[nodiscard]] virtual bool sniff(std::span<const std::uint8_t> data,
                                     const decode_options& options) const noexcept = 0;

    // Container header fields for display; empty for headerless containers
    [[nodiscard]] virtual decode_result read_header(std::span<const std::uint8_t> data,
                                                    parsed_header& header) const = 0;

    [[nodiscard]] virtual decode_result scan(std::span<const std::uint8_t> data,
                                             std::vector<texture_record>& records,
                                             const decode_options& options) const = 0;

    [[nodiscard]] virtual decode_result decode(std::span<const std::uint8_t> data,
                                               const texture_record& record,
                                               surface& surf,
                                               const decode_options& options) const = 0;

    [[nodiscard]] virtual export_format default_export() const noexcept = 0;

    // Output file name without extension
    [[nodiscard]] virtual std::string export_stem(const texture_record& record,
                                                  std::size_t index) const = 0;
};

// ============================================================================
// Source Registry
// ============================================================================

/**
 * Registry for texture sources.
 * Built-in sources are registered by default; sniffing tries them in
 * registration order, the fixed-header source first.
 */
class PS2TEX_EXPORT source_registry {
public:
    /**
     * Get the global source registry instance.
     */
    [[nodiscard]] static source_registry& instance();

    /**
     * Register a source.
     * @param src Unique pointer to source (ownership transferred)
     */
    void register_source(std::unique_ptr<texture_source> src);

    /**
     * Find source by sniffing data.
     * @param data Raw file data
     * @param options Patterns used by sniffing
     * @return Pointer to source if found, nullptr otherwise
     */
    [[nodiscard]] const texture_source* find_source(std::span<const std::uint8_t> data,
                                                    const decode_options& options = {}) const;

    /**
     * Find source by name.
     * @param name Source name (e.g., "marker")
     * @return Pointer to source if found, nullptr otherwise
     */
    [[nodiscard]] const texture_source* find_source(std::string_view name) const;

    [[nodiscard]] std::size_t source_count() const noexcept {
        return sources_.size();
    }

    [[nodiscard]] const texture_source* source_at(std::size_t index) const noexcept {
        return index < sources_.size() ? sources_[index].get() : nullptr;
    }

private:
    source_registry();
    ~source_registry();

    source_registry(const source_registry&) = delete;
    source_registry& operator=(const source_registry&) = delete;

    void register_builtin_sources();

    std::vector<std::unique_ptr<texture_source>> sources_;
};

} // namespace ps2tex

#endif // PS2TEX_SOURCE_HPP_
