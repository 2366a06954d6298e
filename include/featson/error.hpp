#pragma once

#include <stdexcept>
#include <string>

namespace featson {

    // Every way a decode can fail. Callers match on kind() rather than on what().
    enum class ErrorKind {
        UnknownType,
        ExpectedObject,
        MissingGeometry,
        InvalidGeometryValue,
        MissingProperties,
        PropertiesExpectedObjectOrNull,
        InvalidIdentifierType,
        BboxExpectedArray,
        BboxExpectedNumericValues,
        MissingMember,
        ExpectedArrayValue,
        ExpectedNumericValue,
        PositionTooShort,
        MalformedJson,
    };

    const char *to_string(ErrorKind kind) noexcept;

    class Error : public std::runtime_error {
      public:
        Error(ErrorKind kind, const std::string &message);

        ErrorKind kind() const noexcept { return kind_; }

      private:
        ErrorKind kind_;
    };

} // namespace featson
