#pragma once

#include "featson/types.hpp"

#include <iosfwd>
#include <string>

namespace featson {

    enum class KeyOrder {
        Alphabetic, // object keys sorted bytewise at every level
        Insertion,  // keys in the order the encoder inserted them
    };

    struct SerializeOptions {
        KeyOrder key_order = KeyOrder::Alphabetic;
        int indent = 0; // 0 writes everything on one line
    };

    // Floats always carry a fraction or exponent ("102.0", not "102") so they read back
    // as floats. NaN and infinities have no JSON form and are written as null.
    std::string format_double(double value);

    std::string to_string(const JsonValue &value, const SerializeOptions &options = {});
    std::string to_string(const Geometry &geometry, const SerializeOptions &options = {});
    std::string to_string(const Feature &feature, const SerializeOptions &options = {});
    std::string to_string(const FeatureCollection &collection, const SerializeOptions &options = {});
    std::string to_string(const GeoJson &geojson, const SerializeOptions &options = {});

    std::ostream &operator<<(std::ostream &os, const Geometry &geometry);
    std::ostream &operator<<(std::ostream &os, const Feature &feature);
    std::ostream &operator<<(std::ostream &os, const FeatureCollection &collection);
    std::ostream &operator<<(std::ostream &os, const GeoJson &geojson);

} // namespace featson
