#include "featson/geometry.hpp"

#include "featson/error.hpp"
#include "featson/util.hpp"
#include "featson/writer.hpp"

#include <string>
#include <utility>

namespace featson {

    namespace {

        const JsonArray &expect_array(const JsonValue &value) {
            if (auto const *array = value.if_array())
                return *array;
            throw Error(ErrorKind::ExpectedArrayValue,
                        "featson::decode_geometry(): expected an array, got " + featson::to_string(value));
        }

        Position decode_position(const JsonValue &value) {
            auto const &array = expect_array(value);
            if (array.size() < 2)
                throw Error(ErrorKind::PositionTooShort, "featson::decode_geometry(): position " +
                                                             featson::to_string(value) +
                                                             " has fewer than two elements");
            Position position;
            position.reserve(array.size());
            for (auto const &item : array) {
                if (!item.is_number())
                    throw Error(ErrorKind::ExpectedNumericValue,
                                "featson::decode_geometry(): expected a number, got " + featson::to_string(item));
                position.push_back(boost::json::value_to<double>(item));
            }
            return position;
        }

        template <typename F> auto decode_each(const JsonValue &value, F &&decode_item) {
            auto const &array = expect_array(value);
            std::vector<decltype(decode_item(array.front()))> out;
            out.reserve(array.size());
            for (auto const &item : array)
                out.push_back(decode_item(item));
            return out;
        }

        LineStringType decode_line_string(const JsonValue &value) { return decode_each(value, decode_position); }

        PolygonType decode_polygon(const JsonValue &value) { return decode_each(value, decode_line_string); }

        JsonArray encode_position(const Position &position) { return JsonArray(position.begin(), position.end()); }

        template <typename T, typename F> JsonArray encode_each(const std::vector<T> &items, F &&encode_item) {
            JsonArray array;
            array.reserve(items.size());
            for (auto const &item : items)
                array.emplace_back(encode_item(item));
            return array;
        }

        JsonArray encode_line_string(const LineStringType &line) { return encode_each(line, encode_position); }

        JsonArray encode_polygon(const PolygonType &polygon) { return encode_each(polygon, encode_line_string); }

        GeometryValue decode_value(const std::string &type, JsonObject &object) {
            if (type == "GeometryCollection") {
                auto geometries = util::require_member(object, members::geometries);
                return GeometryCollection{
                    decode_each(geometries, [](const JsonValue &item) { return decode_geometry_value(item); })};
            }

            if (type != "Point" && type != "MultiPoint" && type != "LineString" && type != "MultiLineString" &&
                type != "Polygon" && type != "MultiPolygon")
                throw Error(ErrorKind::UnknownType, "featson::decode_geometry(): unknown geometry type '" + type + "'");

            auto coordinates = util::require_member(object, members::coordinates);
            if (type == "Point")
                return Point{decode_position(coordinates)};
            if (type == "MultiPoint")
                return MultiPoint{decode_each(coordinates, decode_position)};
            if (type == "LineString")
                return LineString{decode_line_string(coordinates)};
            if (type == "MultiLineString")
                return MultiLineString{decode_each(coordinates, decode_line_string)};
            if (type == "Polygon")
                return Polygon{decode_polygon(coordinates)};
            return MultiPolygon{decode_each(coordinates, decode_polygon)};
        }

    } // namespace

    Geometry decode_geometry_object(JsonObject object) {
        auto type = util::expect_type(object);
        Geometry geometry{decode_value(type, object), std::nullopt, std::nullopt};
        geometry.bbox = util::get_bbox(object);
        if (std::holds_alternative<GeometryCollection>(geometry.value))
            geometry.foreign_members = util::get_foreign_members(std::move(object), kGeometryCollectionMembers);
        else
            geometry.foreign_members = util::get_foreign_members(std::move(object), kGeometryMembers);
        return geometry;
    }

    Geometry decode_geometry_value(JsonValue value) {
        if (auto *object = value.if_object())
            return decode_geometry_object(std::move(*object));
        throw Error(ErrorKind::ExpectedObject,
                    "featson::decode_geometry_value(): expected an object, got " + featson::to_string(value));
    }

    JsonObject encode_geometry(const Geometry &geometry) {
        JsonObject object;
        object[members::type] = geometry_type_name(geometry.value);

        std::visit(
            [&](auto const &shape) {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, Point>) {
                    object[members::coordinates] = encode_position(shape.coordinates);
                } else if constexpr (std::is_same_v<T, MultiPoint>) {
                    object[members::coordinates] = encode_each(shape.coordinates, encode_position);
                } else if constexpr (std::is_same_v<T, LineString>) {
                    object[members::coordinates] = encode_line_string(shape.coordinates);
                } else if constexpr (std::is_same_v<T, MultiLineString>) {
                    object[members::coordinates] = encode_each(shape.coordinates, encode_line_string);
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    object[members::coordinates] = encode_polygon(shape.coordinates);
                } else if constexpr (std::is_same_v<T, MultiPolygon>) {
                    object[members::coordinates] = encode_each(shape.coordinates, encode_polygon);
                } else {
                    object[members::geometries] = encode_each(shape.geometries, encode_geometry);
                }
            },
            geometry.value);

        if (geometry.bbox)
            object[members::bbox] = util::encode_bbox(*geometry.bbox);

        if (std::holds_alternative<GeometryCollection>(geometry.value))
            util::put_foreign_members(object, geometry.foreign_members, kGeometryCollectionMembers);
        else
            util::put_foreign_members(object, geometry.foreign_members, kGeometryMembers);
        return object;
    }

    void tag_invoke(const boost::json::value_from_tag &, JsonValue &jv, const Geometry &geometry) {
        jv = encode_geometry(geometry);
    }

    Geometry tag_invoke(const boost::json::value_to_tag<Geometry> &, const JsonValue &jv) {
        return decode_geometry_value(jv);
    }

} // namespace featson
