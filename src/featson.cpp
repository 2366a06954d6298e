#include "featson/featson.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace featson {

    GeoJson read(const std::filesystem::path &file) {
        std::ifstream ifs(file);
        if (!ifs) {
            throw std::runtime_error("featson::read(): cannot open \"" + file.string() + '\"');
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();
        spdlog::debug("featson::read(): {} bytes from \"{}\"", buffer.str().size(), file.string());

        try {
            return parse(buffer.str());
        } catch (const Error &e) {
            spdlog::debug("featson::read(): \"{}\" rejected: {} ({})", file.string(), e.what(), to_string(e.kind()));
            throw;
        }
    }

    void write(const GeoJson &geojson, const std::filesystem::path &outPath, const SerializeOptions &options) {
        std::ofstream ofs(outPath);
        if (!ofs)
            throw std::runtime_error("featson::write(): cannot open for write: " + outPath.string());
        ofs << to_string(geojson, options) << "\n";
        spdlog::debug("featson::write(): wrote \"{}\"", outPath.string());
    }

} // namespace featson
