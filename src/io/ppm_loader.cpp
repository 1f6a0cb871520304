#include "io/ppm_loader.hpp"

#include "codec/raster_codec.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace ppmsteg {

std::vector<uint8_t> read_file_bytes(const std::string& path) {
    namespace fs = std::filesystem;
    if (fs::exists(path) && fs::is_directory(path)) {
        throw std::runtime_error("Not a file: " + path);
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    ifs.seekg(0, std::ios::end);
    const std::streamsize n = ifs.tellg();
    if (n < 0) throw std::runtime_error("Cannot read file: " + path);
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), n);
    if (ifs.gcount() != n) throw std::runtime_error("Short read: " + path);
    return buf;
}

RasterImage load_ppm(const std::string& path) {
    const std::string id = std::filesystem::path(path).filename().string();
    return parse_ppm(read_file_bytes(path), id);
}

} // namespace ppmsteg
