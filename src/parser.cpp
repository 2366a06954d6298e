#include "featson/parser.hpp"

#include "featson/collection.hpp"
#include "featson/error.hpp"
#include "featson/feature.hpp"
#include "featson/geometry.hpp"
#include "featson/writer.hpp"

#include <string>
#include <type_traits>

namespace featson {

    JsonValue parse_json(std::string_view text) {
        boost::json::error_code ec;
        JsonValue value = boost::json::parse(text, ec);
        if (ec)
            throw Error(ErrorKind::MalformedJson, "featson::parse_json(): " + ec.message());
        return value;
    }

    GeoJson decode_geojson_object(JsonObject object) {
        auto it = object.find(members::type);
        if (it == object.end() || !it->value().is_string())
            throw Error(ErrorKind::UnknownType, "featson::decode_geojson_object(): object has no string 'type' field");

        auto type = boost::json::value_to<std::string>(it->value());
        if (type == "Feature")
            return decode_feature_object(std::move(object));
        if (type == "FeatureCollection")
            return decode_collection_object(std::move(object));
        return decode_geometry_object(std::move(object));
    }

    GeoJson decode_geojson_value(JsonValue value) {
        if (auto *object = value.if_object())
            return decode_geojson_object(std::move(*object));
        throw Error(ErrorKind::ExpectedObject,
                    "featson::decode_geojson_value(): expected an object, got " + featson::to_string(value));
    }

    JsonObject encode_geojson(const GeoJson &geojson) {
        return std::visit(
            [](auto const &item) -> JsonObject {
                using T = std::decay_t<decltype(item)>;
                if constexpr (std::is_same_v<T, Geometry>) {
                    return encode_geometry(item);
                } else if constexpr (std::is_same_v<T, Feature>) {
                    return encode_feature(item);
                } else {
                    return encode_collection(item);
                }
            },
            geojson);
    }

    GeoJson parse(std::string_view text) { return decode_geojson_value(parse_json(text)); }

    Feature parse_feature(std::string_view text) { return decode_feature_value(parse_json(text)); }

} // namespace featson
