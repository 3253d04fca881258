#ifndef PS2TEX_FILE_IO_HPP_
#define PS2TEX_FILE_IO_HPP_

#include <ps2tex/ps2tex_export.h>
#include <ps2tex/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace ps2tex {

/**
 * Read a whole file into memory.
 * @param path File to read
 * @param data Receives the contents
 * @param max_size Files larger than this are rejected
 * @return io_error naming the path on open/read failure or oversize input
 */
[[nodiscard]] PS2TEX_EXPORT decode_result read_file(const std::filesystem::path& path,
                                                    std::vector<std::uint8_t>& data,
                                                    std::size_t max_size);

/**
 * Write bytes to a file, replacing it.
 * @return io_error naming the path on failure
 */
[[nodiscard]] PS2TEX_EXPORT decode_result write_file(const std::filesystem::path& path,
                                                     std::span<const std::uint8_t> data);

} // namespace ps2tex

#endif // PS2TEX_FILE_IO_HPP_
