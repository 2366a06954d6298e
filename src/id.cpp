#include "featson/id.hpp"

namespace featson {

    double Number::as_double() const noexcept {
        return std::visit([](auto v) { return static_cast<double>(v); }, storage_);
    }

    boost::json::value Number::to_json() const {
        return std::visit([](auto v) { return boost::json::value(v); }, storage_);
    }

    std::optional<Number> Number::from_json(const boost::json::value &value) {
        switch (value.kind()) {
        case boost::json::kind::int64:
            return Number(value.get_int64());
        case boost::json::kind::uint64:
            return Number(value.get_uint64());
        case boost::json::kind::double_:
            return Number(value.get_double());
        default:
            return std::nullopt;
        }
    }

    boost::json::value encode_id(const Id &id) {
        if (auto const *s = std::get_if<std::string>(&id))
            return boost::json::value(*s);
        return std::get<Number>(id).to_json();
    }

    std::optional<Id> decode_id(const boost::json::value &value) {
        if (value.is_string())
            return Id{boost::json::value_to<std::string>(value)};
        if (auto number = Number::from_json(value))
            return Id{*number};
        return std::nullopt;
    }

} // namespace featson
