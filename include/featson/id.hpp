#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace featson {

    // A JSON number as it appeared in the source. Non-negative integers are held as
    // uint64, negative integers as int64 and everything else as double, so that 0
    // and 0.0 stay distinct and compare unequal.
    class Number {
      public:
        using Storage = std::variant<std::uint64_t, std::int64_t, double>;

        template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>, int> = 0>
        Number(T value)
            : storage_(value < 0 ? Storage{static_cast<std::int64_t>(value)}
                                 : Storage{static_cast<std::uint64_t>(value)}) {}

        template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> &&
                                                   !std::is_same_v<T, bool>,
                                               int> = 0>
        Number(T value) : storage_(static_cast<std::uint64_t>(value)) {}

        Number(double value) : storage_(value) {}

        bool is_integer() const noexcept { return !std::holds_alternative<double>(storage_); }
        bool is_float() const noexcept { return std::holds_alternative<double>(storage_); }

        double as_double() const noexcept;

        const Storage &storage() const noexcept { return storage_; }

        boost::json::value to_json() const;

        // Returns nullopt when the value is not a JSON number.
        static std::optional<Number> from_json(const boost::json::value &value);

        friend bool operator==(const Number &a, const Number &b) { return a.storage_ == b.storage_; }
        friend bool operator!=(const Number &a, const Number &b) { return !(a == b); }

      private:
        Storage storage_;
    };

    // Feature identifier, RFC 7946 §3.2: a string or a number, nothing else.
    using Id = std::variant<std::string, Number>;

    boost::json::value encode_id(const Id &id);

    // Returns nullopt when the value is neither a string nor a number.
    std::optional<Id> decode_id(const boost::json::value &value);

} // namespace featson
