#include "featson/util.hpp"

#include "featson/error.hpp"
#include "featson/geometry.hpp"
#include "featson/writer.hpp"

namespace featson::util {

    std::string expect_type(JsonObject &object) {
        auto value = take_member(object, members::type);
        if (!value)
            throw Error(ErrorKind::UnknownType, "featson::expect_type(): object has no 'type' member");
        if (!value->is_string())
            throw Error(ErrorKind::UnknownType,
                        "featson::expect_type(): 'type' member is not a string: " + featson::to_string(*value));
        return boost::json::value_to<std::string>(*value);
    }

    std::optional<JsonValue> take_member(JsonObject &object, std::string_view key) {
        auto it = object.find(key);
        if (it == object.end())
            return std::nullopt;
        return std::move(it->value());
    }

    JsonValue require_member(JsonObject &object, std::string_view key) {
        auto value = take_member(object, key);
        if (!value)
            throw Error(ErrorKind::MissingMember, "featson: expected member '" + std::string(key) + "'");
        return std::move(*value);
    }

    std::optional<Geometry> get_geometry(JsonObject &object) {
        auto value = take_member(object, members::geometry);
        if (!value)
            throw Error(ErrorKind::MissingGeometry, "featson::get_geometry(): Feature has no 'geometry' member");
        if (value->is_null())
            return std::nullopt;
        if (auto *geometry = value->if_object())
            return decode_geometry_object(std::move(*geometry));
        throw Error(ErrorKind::InvalidGeometryValue,
                    "featson::get_geometry(): 'geometry' must be a geometry object or null, got " +
                        featson::to_string(*value));
    }

    std::optional<JsonObject> get_properties(JsonObject &object) {
        auto value = take_member(object, members::properties);
        if (!value)
            throw Error(ErrorKind::MissingProperties,
                        "featson::get_properties(): Feature has no 'properties' member");
        if (value->is_null())
            return std::nullopt;
        if (auto *properties = value->if_object())
            return std::move(*properties);
        throw Error(ErrorKind::PropertiesExpectedObjectOrNull,
                    "featson::get_properties(): 'properties' must be an object or null, got " +
                        featson::to_string(*value));
    }

    std::optional<Id> get_id(JsonObject &object) {
        auto value = take_member(object, members::id);
        if (!value)
            return std::nullopt;
        if (auto id = decode_id(*value))
            return id;
        throw Error(ErrorKind::InvalidIdentifierType,
                    "featson::get_id(): 'id' must be a string or a number, got " + featson::to_string(*value));
    }

    std::optional<Bbox> get_bbox(JsonObject &object) {
        auto value = take_member(object, members::bbox);
        if (!value)
            return std::nullopt;
        auto const *array = value->if_array();
        if (!array)
            throw Error(ErrorKind::BboxExpectedArray,
                        "featson::get_bbox(): 'bbox' must be an array, got " + featson::to_string(*value));
        Bbox bbox;
        bbox.reserve(array->size());
        for (auto const &item : *array) {
            if (!item.is_number())
                throw Error(ErrorKind::BboxExpectedNumericValues,
                            "featson::get_bbox(): 'bbox' holds a non-numeric value " + featson::to_string(item));
            bbox.push_back(boost::json::value_to<double>(item));
        }
        return bbox;
    }

    JsonArray encode_bbox(const Bbox &bbox) { return JsonArray(bbox.begin(), bbox.end()); }

} // namespace featson::util
