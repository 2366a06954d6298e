#pragma once

#include "featson/collection.hpp"
#include "featson/error.hpp"
#include "featson/feature.hpp"
#include "featson/geometry.hpp"
#include "featson/parser.hpp"
#include "featson/types.hpp"
#include "featson/writer.hpp"

#include <filesystem>

namespace featson {

    GeoJson read(const std::filesystem::path &file);

    void write(const GeoJson &geojson, const std::filesystem::path &outPath, const SerializeOptions &options = {});

} // namespace featson
