#include "featson/feature.hpp"

#include "featson/error.hpp"
#include "featson/geometry.hpp"
#include "featson/util.hpp"
#include "featson/writer.hpp"

namespace featson {

    Feature decode_feature_object(JsonObject object) {
        auto type = util::expect_type(object);
        if (type != "Feature")
            throw Error(ErrorKind::UnknownType,
                        "featson::decode_feature_object(): expected type 'Feature', got '" + type + "'");

        Feature feature;
        feature.geometry = util::get_geometry(object);
        feature.properties = util::get_properties(object);
        feature.id = util::get_id(object);
        feature.bbox = util::get_bbox(object);
        feature.foreign_members = util::get_foreign_members(std::move(object), kFeatureMembers);
        return feature;
    }

    Feature decode_feature_value(JsonValue value) {
        if (auto *object = value.if_object())
            return decode_feature_object(std::move(*object));
        throw Error(ErrorKind::ExpectedObject,
                    "featson::decode_feature_value(): expected an object, got " + featson::to_string(value));
    }

    JsonObject encode_feature(const Feature &feature) {
        JsonObject object;
        object[members::type] = "Feature";

        if (feature.geometry)
            object[members::geometry] = encode_geometry(*feature.geometry);
        else
            object[members::geometry] = nullptr;

        if (feature.properties)
            object[members::properties] = *feature.properties;
        else
            object[members::properties] = JsonObject();

        if (feature.bbox)
            object[members::bbox] = util::encode_bbox(*feature.bbox);

        if (feature.id)
            object[members::id] = encode_id(*feature.id);

        util::put_foreign_members(object, feature.foreign_members, kFeatureMembers);
        return object;
    }

    void tag_invoke(const boost::json::value_from_tag &, JsonValue &jv, const Feature &feature) {
        jv = encode_feature(feature);
    }

    Feature tag_invoke(const boost::json::value_to_tag<Feature> &, const JsonValue &jv) {
        return decode_feature_value(jv);
    }

} // namespace featson
