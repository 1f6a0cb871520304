#include "io/ppm_saver.hpp"

#include "codec/raster_codec.hpp"

#include <fstream>
#include <stdexcept>

namespace ppmsteg {

void write_file_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

void save_ppm(const std::string& path, const RasterImage& im) {
    // validate before touching path
    const auto bytes = serialize_ppm(im);
    write_file_bytes(path, bytes);
}

} // namespace ppmsteg
