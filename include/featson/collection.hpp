#pragma once

#include "featson/types.hpp"

namespace featson {

    FeatureCollection decode_collection_object(JsonObject object);

    FeatureCollection decode_collection_value(JsonValue value);

    JsonObject encode_collection(const FeatureCollection &collection);

    void tag_invoke(const boost::json::value_from_tag &, JsonValue &jv, const FeatureCollection &collection);

    FeatureCollection tag_invoke(const boost::json::value_to_tag<FeatureCollection> &, const JsonValue &jv);

} // namespace featson
