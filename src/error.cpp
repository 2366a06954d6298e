#include "featson/error.hpp"

namespace featson {

    const char *to_string(ErrorKind kind) noexcept {
        switch (kind) {
        case ErrorKind::UnknownType:
            return "unknown type";
        case ErrorKind::ExpectedObject:
            return "expected object";
        case ErrorKind::MissingGeometry:
            return "missing geometry";
        case ErrorKind::InvalidGeometryValue:
            return "invalid geometry value";
        case ErrorKind::MissingProperties:
            return "missing properties";
        case ErrorKind::PropertiesExpectedObjectOrNull:
            return "properties expected object or null";
        case ErrorKind::InvalidIdentifierType:
            return "invalid identifier type";
        case ErrorKind::BboxExpectedArray:
            return "bbox expected array";
        case ErrorKind::BboxExpectedNumericValues:
            return "bbox expected numeric values";
        case ErrorKind::MissingMember:
            return "missing member";
        case ErrorKind::ExpectedArrayValue:
            return "expected array value";
        case ErrorKind::ExpectedNumericValue:
            return "expected numeric value";
        case ErrorKind::PositionTooShort:
            return "position too short";
        case ErrorKind::MalformedJson:
            return "malformed json";
        }
        return "unknown error";
    }

    Error::Error(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

} // namespace featson
