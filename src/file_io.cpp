#include <ps2tex/file_io.hpp>

#include <fstream>
#include <system_error>

namespace ps2tex {

decode_result read_file(const std::filesystem::path& path,
                        std::vector<std::uint8_t>& data,
                        std::size_t max_size) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return decode_result::failure(decode_error::io_error,
            "Cannot open " + path.string() + ": " + ec.message());
    }
    if (size > max_size) {
        return decode_result::failure(decode_error::io_error,
            path.string() + " is " + std::to_string(size) + " bytes, limit is " +
            std::to_string(max_size));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return decode_result::failure(decode_error::io_error, "Cannot open " + path.string());
    }

    std::vector<std::uint8_t> contents(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(contents.data()), static_cast<std::streamsize>(contents.size()));
    if (file.gcount() != static_cast<std::streamsize>(contents.size())) {
        return decode_result::failure(decode_error::io_error, "Short read from " + path.string());
    }

    data = std::move(contents);
    return decode_result::success();
}

decode_result write_file(const std::filesystem::path& path, std::span<const std::uint8_t> data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return decode_result::failure(decode_error::io_error, "Cannot create " + path.string());
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        return decode_result::failure(decode_error::io_error, "Failed writing " + path.string());
    }
    return decode_result::success();
}

} // namespace ps2tex
