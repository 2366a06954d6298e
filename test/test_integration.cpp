#include <doctest/doctest.h>

#include "featson/featson.hpp"

#include <string>
#include <vector>

namespace {

    std::vector<featson::Feature> sample_features() {
        std::vector<featson::Feature> features;

        featson::Feature bare;
        bare.properties = featson::JsonObject();
        features.push_back(bare);

        featson::Feature null_properties;
        null_properties.geometry = featson::Geometry{featson::Point{{1.5, 2.5}}};
        features.push_back(null_properties);

        featson::Feature full;
        full.geometry = featson::Geometry{featson::Polygon{{{{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {0.0, 0.0}}}}};
        featson::JsonObject props;
        props["name"] = "square";
        props["area"] = 0.5;
        props["tags"] = featson::JsonArray{"a", "b"};
        props["missing"] = nullptr;
        full.properties = props;
        full.id = std::string("sq-1");
        full.bbox = featson::Bbox{0.0, 0.0, 1.0, 1.0};
        features.push_back(full);

        featson::Feature numbered;
        numbered.geometry = featson::Geometry{featson::MultiPoint{{{1.0, 2.0}, {3.0, 4.0, 5.0}}}};
        numbered.properties = featson::JsonObject();
        numbered.id = featson::Number(-12);
        features.push_back(numbered);

        featson::GeometryCollection nested;
        nested.geometries.push_back(featson::Geometry{featson::LineString{{{0.5, 0.5}, {1.5, 1.5}}}});
        featson::Feature collection_feature;
        collection_feature.geometry = featson::Geometry{nested};
        collection_feature.properties = featson::JsonObject();
        collection_feature.id = featson::Number(0.25);
        features.push_back(collection_feature);

        return features;
    }

} // namespace

TEST_CASE("Integration - Round trip without foreign members") {
    for (auto const &feature : sample_features()) {
        CAPTURE(featson::to_string(feature));
        auto decoded = featson::decode_feature_object(featson::encode_feature(feature));

        if (feature.properties) {
            CHECK(decoded == feature);
        } else {
            // Absent properties come back as an empty object.
            CHECK_FALSE(decoded == feature);
            REQUIRE(decoded.properties.has_value());
            CHECK(decoded.properties->empty());
            decoded.properties.reset();
            CHECK(decoded == feature);
        }

        CHECK(featson::parse_feature(featson::to_string(decoded)) == decoded);
    }
}

TEST_CASE("Integration - Round trip with foreign members") {
    for (auto feature : sample_features()) {
        if (!feature.properties)
            continue;
        featson::JsonObject foreign;
        foreign["z_last"] = featson::JsonArray{1, 2, 3};
        foreign["a_first"] = featson::JsonObject{{"k", "v"}};
        foreign["title"] = "x";
        feature.foreign_members = foreign;

        auto decoded = featson::parse_feature(featson::to_string(feature));
        CHECK(decoded == feature);
        REQUIRE(decoded.foreign_members.has_value());
        CHECK(decoded.foreign_members->size() == 3);
        CHECK(decoded.foreign_members->at("z_last") == featson::parse_json("[1,2,3]"));
    }
}

TEST_CASE("Integration - Boost.JSON conversion hooks") {
    auto features = sample_features();

    SUBCASE("value_from and value_to on a single feature") {
        auto const &feature = features[2];
        boost::json::value value = boost::json::value_from(feature);
        REQUIRE(value.is_object());
        CHECK(value.get_object() == featson::encode_feature(feature));
        CHECK(boost::json::value_to<featson::Feature>(value) == feature);
    }

    SUBCASE("Features nested in a larger document") {
        boost::json::object document;
        document["layer"] = "fields";
        document["items"] = boost::json::value_from(features);

        auto items = boost::json::value_to<std::vector<featson::Feature>>(document.at("items"));
        REQUIRE(items.size() == features.size());
        CHECK(items[2] == features[2]);
        CHECK(items[3] == features[3]);
    }

    SUBCASE("Geometry and collection hooks") {
        auto const &geometry = *features[2].geometry;
        CHECK(boost::json::value_to<featson::Geometry>(boost::json::value_from(geometry)) == geometry);

        featson::FeatureCollection collection;
        collection.features = {features[2], features[3]};
        CHECK(boost::json::value_to<featson::FeatureCollection>(boost::json::value_from(collection)) == collection);
    }

    SUBCASE("Decode errors surface as featson::Error") {
        CHECK_THROWS_AS(boost::json::value_to<featson::Feature>(featson::parse_json(R"({"type":"Feature"})")),
                        featson::Error);
    }
}
