// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file NoiseConfig.hpp
 * @brief Loading noise models from YAML documents
 *
 * Document format:
 * @code
 * noise_model:
 *   - gate: H
 *     error: pauli
 *     px: 0.5
 *     source_qubits: 1
 *   - gate: CNOT
 *     error: thermal_relaxation
 *     t1: 2.0
 *     t2: 1.0
 *     time: 0.1
 *     seed: 42
 *     target_qubits: [0, 1]
 *   - gate: X
 *     error: reset
 *     p0: 0.1
 *     p1: 0.05
 * @endcode
 *
 * Optional fields set to null (`px: ~`) are treated as absent.
 * Entries are registered in document order, so a later entry for the same
 * gate replaces an earlier one. Every problem in the document is reported,
 * with its line and column, in a single NoiseConfigException.
 *
 * @see NoiseModel.hpp for the model being built
 * @see NoiseError.hpp for the error types
 */

#pragma once

#include "NoiseError.hpp"
#include "NoiseModel.hpp"
#include "QuantumError.hpp"
#include "../ir/Gate.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace qnoise::noise {

/**
 * @brief Builds a NoiseModel from a YAML document.
 *
 * A loader is single-use: construct it with the document text and call
 * load() once.
 */
class NoiseConfigLoader {
public:
    explicit NoiseConfigLoader(std::string source)
        : source_(std::move(source)) {}

    /**
     * @brief Parses the document and builds the model.
     * @return The noise model described by the document
     * @throws NoiseConfigException listing every error found
     */
    [[nodiscard]] NoiseModel load() {
        errors_.clear();

        YAML::Node root;
        try {
            root = YAML::Load(source_);
        } catch (const YAML::ParserException& e) {
            errors_.emplace_back(NoiseConfigErrorKind::Syntax, e.msg, locationOf(e.mark));
            throw NoiseConfigException(std::move(errors_));
        }

        NoiseModel model;
        if (!root.IsMap()) {
            error(NoiseConfigErrorKind::TypeMismatch,
                  "document root must be a map with a 'noise_model' sequence, got " +
                      nodeClass(root),
                  root);
            throw NoiseConfigException(std::move(errors_));
        }

        for (const auto& field : root) {
            const std::string key = field.first.Scalar();
            if (key != "noise_model") {
                error(NoiseConfigErrorKind::UnknownField,
                      "unknown field '" + key + "' at document root", field.first);
            }
        }

        const YAML::Node entries = root["noise_model"];
        if (!entries) {
            error(NoiseConfigErrorKind::MissingField,
                  "missing required field 'noise_model'", root);
        } else if (entries.IsSequence()) {
            for (const auto& entry : entries) {
                loadEntry(entry, model);
            }
        } else if (!entries.IsNull()) {
            // A null value ("noise_model:" alone) is an empty model.
            error(NoiseConfigErrorKind::TypeMismatch,
                  "'noise_model' must be a sequence, got " + nodeClass(entries), entries);
        }

        if (!errors_.empty()) {
            throw NoiseConfigException(std::move(errors_));
        }
        return model;
    }

private:
    std::string source_;
    std::vector<NoiseConfigError> errors_;

    static constexpr std::string_view ENTRY_FIELDS[] = {
        "gate", "error", "seed", "source_qubits", "target_qubits"};

    // -------------------------------------------------------------------------
    // Entries
    // -------------------------------------------------------------------------

    void loadEntry(const YAML::Node& entry, NoiseModel& model) {
        if (!entry.IsMap()) {
            error(NoiseConfigErrorKind::TypeMismatch,
                  "noise model entry must be a map, got " + nodeClass(entry), entry);
            return;
        }

        const std::size_t errors_before = errors_.size();

        std::optional<ir::GateType> gate = loadGateType(entry);
        std::optional<ErrorKind> kind = loadErrorKind(entry);

        if (kind.has_value()) {
            checkEntryFields(entry, *kind);
        }

        std::vector<double> parameters;
        if (kind.has_value()) {
            parameters = loadParameters(entry, *kind);
        }
        std::optional<Seed> seed = loadSeed(entry);
        std::optional<QubitFilter> source = loadQubitFilter(entry, "source_qubits");
        std::optional<QubitFilter> target = loadQubitFilter(entry, "target_qubits");

        if (errors_.size() != errors_before || !gate.has_value() || !kind.has_value()) {
            return;
        }

        try {
            model.add(makeError(*kind, parameters, seed), *gate,
                      std::move(source), std::move(target));
        } catch (const InvalidParameterError& e) {
            error(NoiseConfigErrorKind::InvalidParameter, e.what(), entry);
        }
    }

    std::optional<ir::GateType> loadGateType(const YAML::Node& entry) {
        std::optional<std::string> name = loadString(entry, "gate");
        if (!name.has_value()) {
            return std::nullopt;
        }
        std::optional<ir::GateType> type = ir::gateTypeFromName(*name);
        if (!type.has_value()) {
            error(NoiseConfigErrorKind::UnknownGate, "unknown gate '" + *name + "'",
                  entry["gate"]);
        }
        return type;
    }

    std::optional<ErrorKind> loadErrorKind(const YAML::Node& entry) {
        std::optional<std::string> name = loadString(entry, "error");
        if (!name.has_value()) {
            return std::nullopt;
        }
        std::optional<ErrorKind> kind = errorKindFromName(*name);
        if (!kind.has_value()) {
            error(NoiseConfigErrorKind::UnknownError,
                  "unknown error '" + *name +
                      "' (expected pauli, thermal_relaxation or reset)",
                  entry["error"]);
        }
        return kind;
    }

    void checkEntryFields(const YAML::Node& entry, ErrorKind kind) {
        const auto names = parameterNames(kind);
        for (const auto& field : entry) {
            const std::string key = field.first.Scalar();
            bool known = false;
            for (std::string_view allowed : ENTRY_FIELDS) {
                known = known || key == allowed;
            }
            for (std::string_view allowed : names) {
                known = known || key == allowed;
            }
            if (!known) {
                error(NoiseConfigErrorKind::UnknownField,
                      "unknown field '" + key + "' for " +
                          std::string(errorKindName(kind)) + " error",
                      field.first);
            }
        }
    }

    std::vector<double> loadParameters(const YAML::Node& entry, ErrorKind kind) {
        const auto names = parameterNames(kind);
        std::vector<double> values;
        for (std::size_t i = 0; i < names.size(); ++i) {
            const std::string name(names[i]);
            const YAML::Node node = entry[name];
            if (!node || node.IsNull()) {
                if (isRequired(kind, i)) {
                    error(NoiseConfigErrorKind::MissingField,
                          "missing required field '" + name + "' for " +
                              std::string(errorKindName(kind)) + " error",
                          entry);
                }
                values.push_back(0.0);
                continue;
            }
            values.push_back(loadNumber(node, name).value_or(0.0));
        }
        return values;
    }

    std::optional<Seed> loadSeed(const YAML::Node& entry) {
        const YAML::Node node = entry["seed"];
        if (!node || node.IsNull()) {
            return std::nullopt;
        }
        // Seeds span the full unsigned 64-bit range.
        if (node.IsScalar() && node.Scalar().rfind('-', 0) != 0) {
            try {
                return node.as<Seed>();
            } catch (const YAML::BadConversion&) {
                // Reported below.
            }
        }
        error(NoiseConfigErrorKind::TypeMismatch,
              "'seed' must be a non-negative integer, got " + describe(node), node);
        return std::nullopt;
    }

    std::optional<QubitFilter> loadQubitFilter(const YAML::Node& entry, const std::string& key) {
        const YAML::Node node = entry[key];
        if (!node || node.IsNull()) {
            return std::nullopt;
        }

        if (node.IsScalar()) {
            std::optional<long long> qubit = loadNonNegativeInteger(node, key);
            if (!qubit.has_value()) {
                return std::nullopt;
            }
            return QubitFilter(static_cast<QubitIndex>(*qubit));
        }

        if (!node.IsSequence()) {
            error(NoiseConfigErrorKind::TypeMismatch,
                  "'" + key + "' must be a qubit index or a sequence of qubit indices, got " +
                      nodeClass(node),
                  node);
            return std::nullopt;
        }

        std::vector<QubitIndex> qubits;
        bool valid = true;
        for (const auto& item : node) {
            std::optional<long long> qubit = loadNonNegativeInteger(item, key);
            if (qubit.has_value()) {
                qubits.push_back(static_cast<QubitIndex>(*qubit));
            } else {
                valid = false;
            }
        }
        if (!valid) {
            return std::nullopt;
        }
        return QubitFilter(qubits);
    }

    // -------------------------------------------------------------------------
    // Scalars
    // -------------------------------------------------------------------------

    std::optional<std::string> loadString(const YAML::Node& entry, const std::string& key) {
        const YAML::Node node = entry[key];
        if (!node) {
            error(NoiseConfigErrorKind::MissingField,
                  "missing required field '" + key + "'", entry);
            return std::nullopt;
        }
        if (!node.IsScalar()) {
            error(NoiseConfigErrorKind::TypeMismatch,
                  "'" + key + "' must be a string, got " + nodeClass(node), node);
            return std::nullopt;
        }
        return node.Scalar();
    }

    std::optional<double> loadNumber(const YAML::Node& node, const std::string& key) {
        if (node.IsScalar()) {
            try {
                return node.as<double>();
            } catch (const YAML::BadConversion&) {
                // Reported below.
            }
        }
        error(NoiseConfigErrorKind::TypeMismatch,
              "'" + key + "' must be a number, got " + describe(node), node);
        return std::nullopt;
    }

    std::optional<long long> loadNonNegativeInteger(const YAML::Node& node, const std::string& key) {
        if (node.IsScalar()) {
            try {
                const long long value = node.as<long long>();
                if (value >= 0) {
                    return value;
                }
            } catch (const YAML::BadConversion&) {
                // Reported below.
            }
        }
        error(NoiseConfigErrorKind::TypeMismatch,
              "'" + key + "' must be a non-negative integer, got " + describe(node), node);
        return std::nullopt;
    }

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    static bool isRequired(ErrorKind kind, std::size_t parameter_index) noexcept {
        switch (kind) {
            case ErrorKind::Pauli:             return false;
            case ErrorKind::ThermalRelaxation: return parameter_index < 3;
            case ErrorKind::Reset:             return true;
        }
        return false;
    }

    static QuantumError makeError(ErrorKind kind,
                                  const std::vector<double>& p,
                                  std::optional<Seed> seed) {
        switch (kind) {
            case ErrorKind::Pauli:
                return QuantumError::pauli(p[0], p[1], p[2], seed);
            case ErrorKind::ThermalRelaxation:
                return QuantumError::thermalRelaxation(p[0], p[1], p[2], p[3], seed);
            case ErrorKind::Reset:
                return QuantumError::reset(p[0], p[1], seed);
        }
        throw std::invalid_argument("unhandled error kind");
    }

    static SourceLocation locationOf(const YAML::Mark& mark) {
        if (mark.is_null()) {
            return SourceLocation{};
        }
        return SourceLocation{static_cast<std::size_t>(mark.line) + 1,
                              static_cast<std::size_t>(mark.column) + 1};
    }

    static std::string nodeClass(const YAML::Node& node) {
        if (!node || node.IsNull()) return "null";
        if (node.IsScalar()) return "scalar";
        if (node.IsSequence()) return "sequence";
        if (node.IsMap()) return "map";
        return "unknown";
    }

    static std::string describe(const YAML::Node& node) {
        if (node.IsScalar()) {
            return "'" + node.Scalar() + "'";
        }
        return nodeClass(node);
    }

    void error(NoiseConfigErrorKind kind, std::string message, const YAML::Node& node) {
        errors_.emplace_back(kind, std::move(message), locationOf(node.Mark()));
    }
};

/**
 * @brief Loads a noise model from YAML text.
 * @throws NoiseConfigException if the document is invalid
 */
[[nodiscard]] inline NoiseModel loadNoiseModel(const std::string& yaml) {
    return NoiseConfigLoader(yaml).load();
}

/**
 * @brief Loads a noise model from a YAML file.
 * @throws std::runtime_error if the file cannot be read
 * @throws NoiseConfigException if the document is invalid
 */
[[nodiscard]] inline NoiseModel loadNoiseModelFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open noise model file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadNoiseModel(buffer.str());
}

}  // namespace qnoise::noise
