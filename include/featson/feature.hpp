#pragma once

#include "featson/types.hpp"

namespace featson {

    /**
     * Decode a Feature object (RFC 7946 §3.2).
     *
     * Members are checked in the order type, geometry, properties, id, bbox and the
     * first failure is thrown as featson::Error. Every member not modelled by Feature
     * ends up in foreign_members, in the order it appeared.
     */
    Feature decode_feature_object(JsonObject object);

    // Throws ErrorKind::ExpectedObject unless the value is an object.
    Feature decode_feature_value(JsonValue value);

    /**
     * Encode a Feature. Never throws.
     *
     * Members are inserted as type, geometry, properties, bbox, id followed by the
     * foreign members. A Feature without properties encodes "properties":{} rather
     * than null. Foreign members named like a Feature member are not written.
     */
    JsonObject encode_feature(const Feature &feature);

    void tag_invoke(const boost::json::value_from_tag &, JsonValue &jv, const Feature &feature);

    Feature tag_invoke(const boost::json::value_to_tag<Feature> &, const JsonValue &jv);

} // namespace featson
