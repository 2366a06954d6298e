#pragma once

#include "featson/types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace featson::util {

    // Field helpers shared by the Geometry, Feature and FeatureCollection decoders.
    // Each one consumes its member: the value is moved out of the object, which is
    // why they take the object by non-const reference. Consumed slots are swept away
    // by get_foreign_members, which skips the reserved member names.

    // Returns the "type" tag. Throws ErrorKind::UnknownType when it is missing or
    // not a string.
    std::string expect_type(JsonObject &object);

    // Moves the member out, nullopt when absent.
    std::optional<JsonValue> take_member(JsonObject &object, std::string_view key);

    // Like take_member but throws ErrorKind::MissingMember when absent.
    JsonValue require_member(JsonObject &object, std::string_view key);

    std::optional<Geometry> get_geometry(JsonObject &object);

    std::optional<JsonObject> get_properties(JsonObject &object);

    std::optional<Id> get_id(JsonObject &object);

    std::optional<Bbox> get_bbox(JsonObject &object);

    template <std::size_t N>
    std::optional<JsonObject> get_foreign_members(JsonObject object,
                                                  const std::array<std::string_view, N> &reserved) {
        JsonObject foreign;
        for (auto &item : object) {
            std::string_view key = item.key();
            if (std::find(reserved.begin(), reserved.end(), key) != reserved.end())
                continue;
            foreign.emplace(key, std::move(item.value()));
        }
        if (foreign.empty())
            return std::nullopt;
        return foreign;
    }

    // Appends foreign members after the modelled ones. Reserved names are skipped so a
    // foreign member can never overwrite a modelled member.
    template <std::size_t N>
    void put_foreign_members(JsonObject &object, const std::optional<JsonObject> &foreign,
                             const std::array<std::string_view, N> &reserved) {
        if (!foreign)
            return;
        for (auto const &item : *foreign) {
            std::string_view key = item.key();
            if (std::find(reserved.begin(), reserved.end(), key) != reserved.end())
                continue;
            object.emplace(key, item.value());
        }
    }

    JsonArray encode_bbox(const Bbox &bbox);

} // namespace featson::util
