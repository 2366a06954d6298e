#include "featson/writer.hpp"

#include "featson/collection.hpp"
#include "featson/feature.hpp"
#include "featson/geometry.hpp"
#include "featson/parser.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <ostream>
#include <string_view>
#include <vector>

namespace featson {

    namespace {

        void newline(std::string &out, const SerializeOptions &options, int depth) {
            if (options.indent <= 0)
                return;
            out += '\n';
            out.append(static_cast<std::size_t>(depth * options.indent), ' ');
        }

        void write_value(std::string &out, const JsonValue &value, const SerializeOptions &options, int depth);

        void write_array(std::string &out, const JsonArray &array, const SerializeOptions &options, int depth) {
            if (array.empty()) {
                out += "[]";
                return;
            }
            out += '[';
            bool first = true;
            for (auto const &item : array) {
                if (!first)
                    out += ',';
                first = false;
                newline(out, options, depth + 1);
                write_value(out, item, options, depth + 1);
            }
            newline(out, options, depth);
            out += ']';
        }

        void write_object(std::string &out, const JsonObject &object, const SerializeOptions &options, int depth) {
            if (object.empty()) {
                out += "{}";
                return;
            }

            std::vector<const boost::json::key_value_pair *> items;
            items.reserve(object.size());
            for (auto const &item : object)
                items.push_back(&item);
            if (options.key_order == KeyOrder::Alphabetic) {
                std::stable_sort(items.begin(), items.end(), [](auto const *a, auto const *b) {
                    return std::string_view(a->key()) < std::string_view(b->key());
                });
            }

            out += '{';
            bool first = true;
            for (auto const *item : items) {
                if (!first)
                    out += ',';
                first = false;
                newline(out, options, depth + 1);
                out += boost::json::serialize(item->key());
                out += options.indent > 0 ? ": " : ":";
                write_value(out, item->value(), options, depth + 1);
            }
            newline(out, options, depth);
            out += '}';
        }

        void write_value(std::string &out, const JsonValue &value, const SerializeOptions &options, int depth) {
            switch (value.kind()) {
            case boost::json::kind::null:
                out += "null";
                break;
            case boost::json::kind::bool_:
                out += value.get_bool() ? "true" : "false";
                break;
            case boost::json::kind::int64:
                out += std::to_string(value.get_int64());
                break;
            case boost::json::kind::uint64:
                out += std::to_string(value.get_uint64());
                break;
            case boost::json::kind::double_:
                out += format_double(value.get_double());
                break;
            case boost::json::kind::string:
                out += boost::json::serialize(value.get_string());
                break;
            case boost::json::kind::array:
                write_array(out, value.get_array(), options, depth);
                break;
            case boost::json::kind::object:
                write_object(out, value.get_object(), options, depth);
                break;
            }
        }

    } // namespace

    std::string format_double(double value) {
        if (!std::isfinite(value))
            return "null";
        char buffer[32];
        auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
        std::string text(buffer, result.ptr);
        if (text.find_first_of(".eE") == std::string::npos)
            text += ".0";
        return text;
    }

    std::string to_string(const JsonValue &value, const SerializeOptions &options) {
        std::string out;
        write_value(out, value, options, 0);
        return out;
    }

    std::string to_string(const Geometry &geometry, const SerializeOptions &options) {
        return to_string(JsonValue(encode_geometry(geometry)), options);
    }

    std::string to_string(const Feature &feature, const SerializeOptions &options) {
        return to_string(JsonValue(encode_feature(feature)), options);
    }

    std::string to_string(const FeatureCollection &collection, const SerializeOptions &options) {
        return to_string(JsonValue(encode_collection(collection)), options);
    }

    std::string to_string(const GeoJson &geojson, const SerializeOptions &options) {
        return to_string(JsonValue(encode_geojson(geojson)), options);
    }

    std::ostream &operator<<(std::ostream &os, const Geometry &geometry) { return os << to_string(geometry); }

    std::ostream &operator<<(std::ostream &os, const Feature &feature) { return os << to_string(feature); }

    std::ostream &operator<<(std::ostream &os, const FeatureCollection &collection) {
        return os << to_string(collection);
    }

    std::ostream &operator<<(std::ostream &os, const GeoJson &geojson) { return os << to_string(geojson); }

} // namespace featson
