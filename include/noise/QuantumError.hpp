// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file QuantumError.hpp
 * @brief Quantum error descriptors realized as noise channel gates
 *
 * A QuantumError bundles the parameters of one physical noise process with
 * the channel gate type that realizes it. Three kinds exist:
 * - Pauli: random X, Y, Z flips with probabilities (px, py, pz)
 * - ThermalRelaxation: T1/T2 relaxation over a gate time
 * - Reset: reset to |0> with p0, to |1> with p1
 *
 * @see NoiseModel.hpp for attaching errors to gate types
 * @see ir/Gate.hpp for the channel gates
 */

#pragma once

#include "NoiseError.hpp"
#include "../ir/Gate.hpp"
#include "../ir/Types.hpp"

#include <cmath>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace qnoise::noise {

/**
 * @brief The closed set of quantum error kinds.
 */
enum class ErrorKind {
    Pauli,
    ThermalRelaxation,
    Reset
};

/**
 * @brief Returns the configuration name of an error kind.
 * @return "pauli", "thermal_relaxation" or "reset"
 */
[[nodiscard]] constexpr std::string_view errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Pauli:             return "pauli";
        case ErrorKind::ThermalRelaxation: return "thermal_relaxation";
        case ErrorKind::Reset:             return "reset";
    }
    return "unknown";
}

/**
 * @brief Looks up an error kind by its configuration name.
 * @return The kind, or std::nullopt for an unrecognized name
 */
[[nodiscard]] inline std::optional<ErrorKind> errorKindFromName(std::string_view name) noexcept {
    for (ErrorKind kind : {ErrorKind::Pauli, ErrorKind::ThermalRelaxation, ErrorKind::Reset}) {
        if (name == errorKindName(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

/**
 * @brief Returns the names of an error kind's parameters, in storage order.
 */
[[nodiscard]] inline std::vector<std::string_view> parameterNames(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Pauli:
            return {"px", "py", "pz"};
        case ErrorKind::ThermalRelaxation:
            return {"t1", "t2", "time", "excited_population"};
        case ErrorKind::Reset:
            return {"p0", "p1"};
    }
    return {};
}

/**
 * @brief Returns the channel gate type that realizes an error kind.
 */
[[nodiscard]] constexpr ir::GateType channelTypeFor(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Pauli:             return ir::GateType::PauliNoise;
        case ErrorKind::ThermalRelaxation: return ir::GateType::ThermalRelaxation;
        case ErrorKind::Reset:             return ir::GateType::Reset;
    }
    return ir::GateType::PauliNoise;
}

/**
 * @brief An immutable quantum error descriptor.
 *
 * Built only through the static factories, which validate every parameter.
 * Parameters are stored exactly as given and copied into each channel gate
 * produced by channel().
 *
 * Example:
 * @code
 * auto bit_flip = QuantumError::pauli(0.1, 0.0, 0.0);
 * auto relax = QuantumError::thermalRelaxation(2.0, 1.0, 0.3);
 *
 * ir::Gate g = bit_flip.channel(3);  // PauliNoise(0.1, 0, 0) q[3]
 * @endcode
 */
class QuantumError {
public:
    // -------------------------------------------------------------------------
    // Factory Methods
    // -------------------------------------------------------------------------

    /**
     * @brief Creates a Pauli error.
     * @param px Probability of an X flip
     * @param py Probability of a Y flip
     * @param pz Probability of a Z flip
     * @param seed Optional seed for the channel's sampling
     * @throws InvalidParameterError if a probability is outside [0, 1] or
     *         px + py + pz exceeds 1
     */
    [[nodiscard]] static QuantumError pauli(Probability px = 0.0,
                                            Probability py = 0.0,
                                            Probability pz = 0.0,
                                            std::optional<Seed> seed = std::nullopt) {
        QuantumError error(ErrorKind::Pauli, {px, py, pz}, seed);
        error.checkProbability(0);
        error.checkProbability(1);
        error.checkProbability(2);
        error.checkTotalProbability();
        return error;
    }

    /**
     * @brief Creates a thermal relaxation error.
     * @param t1 Amplitude damping time, must be > 0
     * @param t2 Dephasing time, must be > 0 and <= 2 * t1
     * @param time Duration of the gate the error follows, must be >= 0
     * @param excited_population Equilibrium excited state population in [0, 1]
     * @param seed Optional seed for the channel's sampling
     * @throws InvalidParameterError if any bound is violated
     */
    [[nodiscard]] static QuantumError thermalRelaxation(double t1,
                                                        double t2,
                                                        double time,
                                                        Probability excited_population = 0.0,
                                                        std::optional<Seed> seed = std::nullopt) {
        QuantumError error(ErrorKind::ThermalRelaxation,
                           {t1, t2, time, excited_population}, seed);
        error.checkPositive(0);
        error.checkPositive(1);
        error.checkNonNegative(2);
        error.checkProbability(3);
        if (t2 > 2.0 * t1) {
            error.fail("t2 must not exceed 2 * t1 (" + formatValue(2.0 * t1) +
                       "), got " + formatValue(t2));
        }
        return error;
    }

    /**
     * @brief Creates a reset error.
     * @param p0 Probability of resetting to |0>
     * @param p1 Probability of resetting to |1>
     * @param seed Optional seed for the channel's sampling
     * @throws InvalidParameterError if a probability is outside [0, 1] or
     *         p0 + p1 exceeds 1
     */
    [[nodiscard]] static QuantumError reset(Probability p0,
                                            Probability p1,
                                            std::optional<Seed> seed = std::nullopt) {
        QuantumError error(ErrorKind::Reset, {p0, p1}, seed);
        error.checkProbability(0);
        error.checkProbability(1);
        error.checkTotalProbability();
        return error;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    /// @brief Returns the parameters in the order parameterNames() lists them.
    [[nodiscard]] const std::vector<double>& parameters() const noexcept {
        return parameters_;
    }

    [[nodiscard]] std::optional<Seed> seed() const noexcept { return seed_; }

    /// @brief Returns the gate type of the channels this error produces.
    [[nodiscard]] ir::GateType channelType() const noexcept {
        return channelTypeFor(kind_);
    }

    /**
     * @brief Realizes this error as a channel gate on one qubit.
     * @param qubit Qubit the channel acts on
     * @return Channel gate carrying this error's parameters and seed
     */
    [[nodiscard]] ir::Gate channel(QubitIndex qubit) const {
        return ir::Gate(channelType(), qubit, parameters_, seed_);
    }

    // -------------------------------------------------------------------------
    // Operators
    // -------------------------------------------------------------------------

    [[nodiscard]] bool operator==(const QuantumError& other) const noexcept {
        return kind_ == other.kind_ &&
               parameters_ == other.parameters_ &&
               seed_ == other.seed_;
    }

    [[nodiscard]] bool operator!=(const QuantumError& other) const noexcept {
        return !(*this == other);
    }

    /**
     * @brief Returns a string representation, e.g. "pauli(px=0.5, py=0, pz=0)".
     */
    [[nodiscard]] std::string toString() const {
        const auto names = parameterNames(kind_);
        std::ostringstream out;
        out << errorKindName(kind_) << "(";
        for (std::size_t i = 0; i < parameters_.size(); ++i) {
            if (i > 0) out << ", ";
            out << names[i] << "=" << parameters_[i];
        }
        if (seed_.has_value()) {
            out << ", seed=" << seed_.value();
        }
        out << ")";
        return out.str();
    }

private:
    ErrorKind kind_;
    std::vector<double> parameters_;
    std::optional<Seed> seed_;

    QuantumError(ErrorKind kind, std::vector<double> parameters, std::optional<Seed> seed)
        : kind_(kind)
        , parameters_(std::move(parameters))
        , seed_(seed) {}

    static std::string formatValue(double value) {
        std::ostringstream out;
        out << value;
        return out.str();
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw InvalidParameterError(std::string(errorKindName(kind_)) + " error: " + message);
    }

    void checkFinite(std::size_t index) const {
        if (!std::isfinite(parameters_[index])) {
            fail(std::string(parameterNames(kind_)[index]) + " must be finite, got " +
                 formatValue(parameters_[index]));
        }
    }

    void checkProbability(std::size_t index) const {
        checkFinite(index);
        const double value = parameters_[index];
        if (value < 0.0 || value > 1.0) {
            fail(std::string(parameterNames(kind_)[index]) + " must be in [0, 1], got " +
                 formatValue(value));
        }
    }

    void checkPositive(std::size_t index) const {
        checkFinite(index);
        if (parameters_[index] <= 0.0) {
            fail(std::string(parameterNames(kind_)[index]) + " must be > 0, got " +
                 formatValue(parameters_[index]));
        }
    }

    void checkNonNegative(std::size_t index) const {
        checkFinite(index);
        if (parameters_[index] < 0.0) {
            fail(std::string(parameterNames(kind_)[index]) + " must be >= 0, got " +
                 formatValue(parameters_[index]));
        }
    }

    void checkTotalProbability() const {
        double total = 0.0;
        for (double p : parameters_) {
            total += p;
        }
        if (total > 1.0 + constants::TOLERANCE) {
            fail("probabilities must sum to at most 1, got " + formatValue(total));
        }
    }
};

inline std::ostream& operator<<(std::ostream& os, const QuantumError& error) {
    os << error.toString();
    return os;
}

}  // namespace qnoise::noise
