#pragma once

#include "featson/types.hpp"

namespace featson {

    // RFC 7946 §3.1. Coordinates are decoded structurally only: positions need two
    // or more numbers, nothing checks ring closure or winding.
    Geometry decode_geometry_object(JsonObject object);

    Geometry decode_geometry_value(JsonValue value);

    // Members in order: type, coordinates (or geometries), bbox, foreign members.
    JsonObject encode_geometry(const Geometry &geometry);

    void tag_invoke(const boost::json::value_from_tag &, JsonValue &jv, const Geometry &geometry);

    Geometry tag_invoke(const boost::json::value_to_tag<Geometry> &, const JsonValue &jv);

} // namespace featson
