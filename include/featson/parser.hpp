#pragma once

#include "featson/types.hpp"

#include <string_view>

namespace featson {

    // Throws ErrorKind::MalformedJson on a syntax error.
    JsonValue parse_json(std::string_view text);

    // Dispatches on "type": Feature, FeatureCollection or one of the seven geometries.
    GeoJson decode_geojson_object(JsonObject object);

    GeoJson decode_geojson_value(JsonValue value);

    JsonObject encode_geojson(const GeoJson &geojson);

    GeoJson parse(std::string_view text);

    Feature parse_feature(std::string_view text);

} // namespace featson
