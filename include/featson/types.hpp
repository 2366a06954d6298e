#pragma once

#include "featson/id.hpp"

#include <boost/json.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace featson {

    using JsonValue = boost::json::value;
    using JsonObject = boost::json::object;
    using JsonArray = boost::json::array;

    // Positions keep however many elements the source had (at least two).
    using Position = std::vector<double>;
    using Bbox = std::vector<double>;

    using LineStringType = std::vector<Position>;
    using PolygonType = std::vector<LineStringType>;

    struct Geometry;

    struct Point {
        Position coordinates;
    };

    struct MultiPoint {
        std::vector<Position> coordinates;
    };

    struct LineString {
        LineStringType coordinates;
    };

    struct MultiLineString {
        std::vector<LineStringType> coordinates;
    };

    struct Polygon {
        PolygonType coordinates;
    };

    struct MultiPolygon {
        std::vector<PolygonType> coordinates;
    };

    struct GeometryCollection {
        std::vector<Geometry> geometries;
    };

    using GeometryValue =
        std::variant<Point, MultiPoint, LineString, MultiLineString, Polygon, MultiPolygon, GeometryCollection>;

    struct Geometry {
        GeometryValue value;
        std::optional<Bbox> bbox;
        std::optional<JsonObject> foreign_members;
    };

    // RFC 7946 §3.2. A missing geometry is an explicit JSON null; a missing
    // properties object is an explicit JSON null and is distinct from an empty one.
    struct Feature {
        std::optional<Geometry> geometry;
        std::optional<JsonObject> properties;
        std::optional<Id> id;
        std::optional<Bbox> bbox;
        std::optional<JsonObject> foreign_members;
    };

    struct FeatureCollection {
        std::vector<Feature> features;
        std::optional<Bbox> bbox;
        std::optional<JsonObject> foreign_members;
    };

    using GeoJson = std::variant<Geometry, Feature, FeatureCollection>;

    namespace members {
        inline constexpr std::string_view type = "type";
        inline constexpr std::string_view geometry = "geometry";
        inline constexpr std::string_view properties = "properties";
        inline constexpr std::string_view id = "id";
        inline constexpr std::string_view bbox = "bbox";
        inline constexpr std::string_view coordinates = "coordinates";
        inline constexpr std::string_view geometries = "geometries";
        inline constexpr std::string_view features = "features";
    } // namespace members

    // Member names each object type models itself. Anything else is a foreign member.
    inline constexpr std::array<std::string_view, 5> kFeatureMembers{
        members::type, members::geometry, members::properties, members::bbox, members::id};
    inline constexpr std::array<std::string_view, 3> kGeometryMembers{members::type, members::coordinates,
                                                                      members::bbox};
    inline constexpr std::array<std::string_view, 3> kGeometryCollectionMembers{members::type, members::geometries,
                                                                                members::bbox};
    inline constexpr std::array<std::string_view, 3> kFeatureCollectionMembers{members::type, members::features,
                                                                               members::bbox};

    inline bool operator==(const Point &a, const Point &b) { return a.coordinates == b.coordinates; }
    inline bool operator==(const MultiPoint &a, const MultiPoint &b) { return a.coordinates == b.coordinates; }
    inline bool operator==(const LineString &a, const LineString &b) { return a.coordinates == b.coordinates; }
    inline bool operator==(const MultiLineString &a, const MultiLineString &b) {
        return a.coordinates == b.coordinates;
    }
    inline bool operator==(const Polygon &a, const Polygon &b) { return a.coordinates == b.coordinates; }
    inline bool operator==(const MultiPolygon &a, const MultiPolygon &b) { return a.coordinates == b.coordinates; }

    bool operator==(const GeometryCollection &a, const GeometryCollection &b);
    bool operator==(const Geometry &a, const Geometry &b);
    bool operator==(const Feature &a, const Feature &b);
    bool operator==(const FeatureCollection &a, const FeatureCollection &b);

    inline bool operator!=(const Geometry &a, const Geometry &b) { return !(a == b); }
    inline bool operator!=(const Feature &a, const Feature &b) { return !(a == b); }
    inline bool operator!=(const FeatureCollection &a, const FeatureCollection &b) { return !(a == b); }

    // Name of the "type" member for a geometry variant, e.g. "MultiPolygon".
    std::string_view geometry_type_name(const GeometryValue &value);

} // namespace featson
