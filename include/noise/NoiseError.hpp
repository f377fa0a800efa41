// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file NoiseError.hpp
 * @brief Error types for quantum errors and noise model configuration
 *
 * InvalidParameterError is thrown when a quantum error is built with an
 * out-of-range parameter. Configuration problems are collected as
 * NoiseConfigError values, each with the line and column of the offending
 * YAML node, and thrown together as a NoiseConfigException.
 *
 * @see QuantumError.hpp for parameter validation
 * @see NoiseConfig.hpp for the YAML loader
 */
#pragma once

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace qnoise::noise {

/**
 * @brief Thrown when a quantum error parameter is outside its valid range.
 */
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Category of noise model configuration error.
 */
enum class NoiseConfigErrorKind {
    Syntax,            ///< Malformed YAML
    UnknownField,      ///< Key not recognized in this context
    MissingField,      ///< Required key absent
    TypeMismatch,      ///< Node has the wrong shape (e.g. string for a qubit)
    UnknownGate,       ///< Gate name not recognized
    UnknownError,      ///< Error kind not recognized
    InvalidParameter,  ///< Parameter rejected by the quantum error
};

/**
 * @brief Get string representation of error kind.
 */
[[nodiscard]] constexpr std::string_view configErrorKindName(NoiseConfigErrorKind kind) noexcept {
    switch (kind) {
        case NoiseConfigErrorKind::Syntax:           return "syntax error";
        case NoiseConfigErrorKind::UnknownField:     return "unknown field";
        case NoiseConfigErrorKind::MissingField:     return "missing field";
        case NoiseConfigErrorKind::TypeMismatch:     return "type mismatch";
        case NoiseConfigErrorKind::UnknownGate:      return "unknown gate";
        case NoiseConfigErrorKind::UnknownError:     return "unknown error";
        case NoiseConfigErrorKind::InvalidParameter: return "invalid parameter";
    }
    return "error";
}

/**
 * @brief Position of a node in a configuration document.
 */
struct SourceLocation {
    std::size_t line = 1;    ///< 1-based line number
    std::size_t column = 1;  ///< 1-based column number

    [[nodiscard]] bool operator==(const SourceLocation& other) const noexcept {
        return line == other.line && column == other.column;
    }

    [[nodiscard]] bool operator!=(const SourceLocation& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief A single error found while loading a noise model.
 */
class NoiseConfigError {
public:
    NoiseConfigError(NoiseConfigErrorKind kind, std::string message, SourceLocation location)
        : kind_(kind)
        , message_(std::move(message))
        , location_(location) {}

    // Accessors
    [[nodiscard]] NoiseConfigErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] SourceLocation location() const noexcept { return location_; }
    [[nodiscard]] std::size_t line() const noexcept { return location_.line; }
    [[nodiscard]] std::size_t column() const noexcept { return location_.column; }

    /**
     * @brief Format the error as a string.
     *
     * Format: "line:column: error_kind: message"
     */
    [[nodiscard]] std::string format() const {
        return std::to_string(location_.line) + ":" +
               std::to_string(location_.column) + ": " +
               std::string(configErrorKindName(kind_)) + ": " +
               message_;
    }

private:
    NoiseConfigErrorKind kind_;
    std::string message_;
    SourceLocation location_;
};

inline std::ostream& operator<<(std::ostream& os, const NoiseConfigError& error) {
    os << error.format();
    return os;
}

/**
 * @brief Exception thrown when a noise model document cannot be loaded.
 *
 * Contains every error found in the document.
 */
class NoiseConfigException : public std::runtime_error {
public:
    explicit NoiseConfigException(NoiseConfigError error)
        : std::runtime_error(error.format())
        , errors_{std::move(error)} {}

    explicit NoiseConfigException(std::vector<NoiseConfigError> errors)
        : std::runtime_error(formatErrors(errors))
        , errors_(std::move(errors)) {}

    [[nodiscard]] const std::vector<NoiseConfigError>& errors() const noexcept {
        return errors_;
    }

    [[nodiscard]] std::size_t numErrors() const noexcept {
        return errors_.size();
    }

private:
    std::vector<NoiseConfigError> errors_;

    static std::string formatErrors(const std::vector<NoiseConfigError>& errors) {
        if (errors.empty()) {
            return "invalid noise model";
        }
        if (errors.size() == 1) {
            return errors[0].format();
        }
        std::string result = std::to_string(errors.size()) + " errors:\n";
        for (const auto& err : errors) {
            result += "  " + err.format() + "\n";
        }
        return result;
    }
};

}  // namespace qnoise::noise
