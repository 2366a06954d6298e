#include "featson/collection.hpp"

#include "featson/error.hpp"
#include "featson/feature.hpp"
#include "featson/util.hpp"
#include "featson/writer.hpp"

namespace featson {

    FeatureCollection decode_collection_object(JsonObject object) {
        auto type = util::expect_type(object);
        if (type != "FeatureCollection")
            throw Error(ErrorKind::UnknownType,
                        "featson::decode_collection_object(): expected type 'FeatureCollection', got '" + type + "'");

        FeatureCollection collection;
        collection.bbox = util::get_bbox(object);

        auto features = util::require_member(object, members::features);
        auto *array = features.if_array();
        if (!array)
            throw Error(ErrorKind::ExpectedArrayValue, "featson::decode_collection_object(): 'features' must be an "
                                                       "array, got " +
                                                           featson::to_string(features));
        collection.features.reserve(array->size());
        for (auto &item : *array)
            collection.features.push_back(decode_feature_value(std::move(item)));

        collection.foreign_members = util::get_foreign_members(std::move(object), kFeatureCollectionMembers);
        return collection;
    }

    FeatureCollection decode_collection_value(JsonValue value) {
        if (auto *object = value.if_object())
            return decode_collection_object(std::move(*object));
        throw Error(ErrorKind::ExpectedObject,
                    "featson::decode_collection_value(): expected an object, got " + featson::to_string(value));
    }

    JsonObject encode_collection(const FeatureCollection &collection) {
        JsonObject object;
        object[members::type] = "FeatureCollection";

        JsonArray features;
        features.reserve(collection.features.size());
        for (auto const &feature : collection.features)
            features.emplace_back(encode_feature(feature));
        object[members::features] = std::move(features);

        if (collection.bbox)
            object[members::bbox] = util::encode_bbox(*collection.bbox);

        util::put_foreign_members(object, collection.foreign_members, kFeatureCollectionMembers);
        return object;
    }

    void tag_invoke(const boost::json::value_from_tag &, JsonValue &jv, const FeatureCollection &collection) {
        jv = encode_collection(collection);
    }

    FeatureCollection tag_invoke(const boost::json::value_to_tag<FeatureCollection> &, const JsonValue &jv) {
        return decode_collection_value(jv);
    }

} // namespace featson
