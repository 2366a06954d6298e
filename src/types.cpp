#include "featson/types.hpp"

#include <type_traits>

namespace featson {

    bool operator==(const GeometryCollection &a, const GeometryCollection &b) { return a.geometries == b.geometries; }

    bool operator==(const Geometry &a, const Geometry &b) {
        return a.value == b.value && a.bbox == b.bbox && a.foreign_members == b.foreign_members;
    }

    bool operator==(const Feature &a, const Feature &b) {
        return a.geometry == b.geometry && a.properties == b.properties && a.id == b.id && a.bbox == b.bbox &&
               a.foreign_members == b.foreign_members;
    }

    bool operator==(const FeatureCollection &a, const FeatureCollection &b) {
        return a.features == b.features && a.bbox == b.bbox && a.foreign_members == b.foreign_members;
    }

    std::string_view geometry_type_name(const GeometryValue &value) {
        return std::visit(
            [](auto const &shape) -> std::string_view {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, Point>) {
                    return "Point";
                } else if constexpr (std::is_same_v<T, MultiPoint>) {
                    return "MultiPoint";
                } else if constexpr (std::is_same_v<T, LineString>) {
                    return "LineString";
                } else if constexpr (std::is_same_v<T, MultiLineString>) {
                    return "MultiLineString";
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    return "Polygon";
                } else if constexpr (std::is_same_v<T, MultiPolygon>) {
                    return "MultiPolygon";
                } else {
                    return "GeometryCollection";
                }
            },
            value);
    }

} // namespace featson
