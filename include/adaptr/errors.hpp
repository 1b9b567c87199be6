/**
 * @file errors.hpp
 * @brief Error taxonomy for the conversion engine
 *
 * Every failure raised by adaptr is an adaptr::Error carrying an ErrorKind and
 * the subject it concerns (a type descriptor rendering or a field path such as
 * "$.crew[1].name"). Components throw the most specific subclass and never wrap
 * one error in another, so callers can catch by kind.
 *
 * Example:
 * @code
 * try {
 *     auto ship = adaptr::load<Ship>(bytes, "binary");
 * } catch (const adaptr::DecodeError& e) {
 *     std::cerr << "[App] corrupt payload: " << e.what() << "\n";
 * } catch (const adaptr::Error& e) {
 *     std::cerr << "[App] " << adaptr::to_string(e.kind()) << ": " << e.what() << "\n";
 * }
 * @endcode
 */

#pragma once

#include <stdexcept>
#include <string>

namespace adaptr {

enum class ErrorKind {
    UnsupportedType,
    NoConverter,
    AmbiguousConverter,
    Schema,
    Decode,
    Range,
    SchemaMismatch,
    UnknownFormat
};

constexpr const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedType:    return "Unsupported type";
        case ErrorKind::NoConverter:        return "No converter";
        case ErrorKind::AmbiguousConverter: return "Ambiguous converter";
        case ErrorKind::Schema:             return "Schema error";
        case ErrorKind::Decode:             return "Decode error";
        case ErrorKind::Range:              return "Value out of range";
        case ErrorKind::SchemaMismatch:     return "Schema mismatch";
        case ErrorKind::UnknownFormat:      return "Unknown format";
        default:                            return "Unknown error";
    }
}

/**
 * @brief Base of all adaptr errors
 *
 * The subject is the descriptor or field path the error is about and may be
 * empty when nothing more specific than the message applies.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, std::string subject = {})
        : std::runtime_error(subject.empty() ? message : message + " (at " + subject + ")")
        , kind_(kind)
        , subject_(std::move(subject)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }

private:
    ErrorKind kind_;
    std::string subject_;
};

/// The type cannot be represented at all (raw pointer, recursive type without converter, ...)
class UnsupportedTypeError : public Error {
public:
    explicit UnsupportedTypeError(const std::string& message, std::string subject = {})
        : Error(ErrorKind::UnsupportedType, message, std::move(subject)) {}
};

/// Representable type, but no converter applies to its descriptor
class NoConverterError : public Error {
public:
    explicit NoConverterError(const std::string& message, std::string subject = {})
        : Error(ErrorKind::NoConverter, message, std::move(subject)) {}
};

/// Two or more converters tie at the highest specificity
class AmbiguousConverterError : public Error {
public:
    explicit AmbiguousConverterError(const std::string& message, std::string subject = {})
        : Error(ErrorKind::AmbiguousConverter, message, std::move(subject)) {}
};

/// A schema cannot be derived (opaque type without a schema hook, pattern descriptor)
class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& message, std::string subject = {})
        : Error(ErrorKind::Schema, message, std::move(subject)) {}
};

/// Bytes are malformed for the selected format
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message, std::string subject = {})
        : Error(ErrorKind::Decode, message, std::move(subject)) {}
};

/// A value exceeds the representable range of its target
class RangeError : public Error {
public:
    explicit RangeError(const std::string& message, std::string subject = {})
        : Error(ErrorKind::Range, message, std::move(subject)) {}
};

/// Well-formed data whose shape does not fit the expected type or schema
class SchemaMismatchError : public Error {
public:
    explicit SchemaMismatchError(const std::string& message, std::string subject = {})
        : Error(ErrorKind::SchemaMismatch, message, std::move(subject)) {}
};

/// No codec is registered under the requested format name
class UnknownFormatError : public Error {
public:
    explicit UnknownFormatError(const std::string& format)
        : Error(ErrorKind::UnknownFormat, "'" + format + "' serialization format not supported") {}
};

} // namespace adaptr
